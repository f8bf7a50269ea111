#include "transport/unix_socket.hpp"

#include <algorithm>
#include <cerrno>
#include <cstring>
#include <thread>
#include <utility>

#include <poll.h>
#include <sys/socket.h>
#include <sys/un.h>
#include <unistd.h>

#include "logging.hpp"
#include "transport/channel_error.hpp"

namespace transport {

namespace {

[[noreturn]] void throw_errno(const std::string &what, int err) {
  throw ChannelError(ChannelError::Code::Transport,
                     what + ": " + std::strerror(err), err);
}

[[noreturn]] void throw_cancelled(const std::string &what) {
  throw ChannelError(ChannelError::Code::Cancelled, what + " cancelled");
}

sockaddr_un make_address(const std::string &socket_path) {
  sockaddr_un addr{};
  if (socket_path.empty() || socket_path.size() >= sizeof(addr.sun_path)) {
    throw ChannelError(ChannelError::Code::Transport,
                       "invalid socket path '" + socket_path + "'", EINVAL);
  }
  addr.sun_family = AF_UNIX;
  std::memcpy(addr.sun_path, socket_path.c_str(), socket_path.size() + 1);
  return addr;
}

int open_stream_socket() {
  int fd = ::socket(AF_UNIX, SOCK_STREAM | SOCK_CLOEXEC, 0);
  if (fd < 0) {
    throw_errno("socket", errno);
  }
  return fd;
}

bool is_endpoint_missing(int err) {
  return err == ENOENT || err == ECONNREFUSED || err == EAGAIN;
}

// Sleeps for delay in poll-interval slices. Returns false if cancelled.
bool sleep_unless_cancelled(std::chrono::milliseconds delay,
                            const CancelToken &cancel) {
  auto deadline = std::chrono::steady_clock::now() + delay;
  while (!cancel.is_cancelled()) {
    auto now = std::chrono::steady_clock::now();
    if (now >= deadline) {
      return true;
    }
    auto remaining =
        std::chrono::duration_cast<std::chrono::milliseconds>(deadline - now);
    std::this_thread::sleep_for(std::min(remaining, kCancelPollInterval));
  }
  return false;
}

} // namespace

// -----------------------------
// UnixSocket
// -----------------------------

UnixSocket::~UnixSocket() { close(); }

UnixSocket::UnixSocket(UnixSocket &&other) noexcept
    : fd_(std::exchange(other.fd_, -1)) {}

UnixSocket &UnixSocket::operator=(UnixSocket &&other) noexcept {
  if (this != &other) {
    close();
    fd_ = std::exchange(other.fd_, -1);
  }
  return *this;
}

void UnixSocket::write_all(const uint8_t *data, size_t len) {
  size_t written = 0;
  while (written < len) {
    ssize_t n = ::send(fd_, data + written, len - written, MSG_NOSIGNAL);
    if (n < 0) {
      if (errno == EINTR) {
        continue;
      }
      throw_errno("send", errno);
    }
    written += static_cast<size_t>(n);
  }
}

size_t UnixSocket::read_some(uint8_t *buf, size_t max_len) {
  for (;;) {
    ssize_t n = ::recv(fd_, buf, max_len, 0);
    if (n >= 0) {
      return static_cast<size_t>(n);
    }
    if (errno == EINTR) {
      continue;
    }
    // A reset from the peer is an abnormal close, not EOF.
    throw_errno("recv", errno);
  }
}

void UnixSocket::shutdown() noexcept {
  if (fd_ >= 0) {
    ::shutdown(fd_, SHUT_RDWR);
  }
}

void UnixSocket::close() noexcept {
  if (fd_ >= 0) {
    ::close(fd_);
    fd_ = -1;
  }
}

// -----------------------------
// Establishment
// -----------------------------

UnixSocket accept_first_connection(const std::string &socket_path,
                                   const CancelToken &cancel) {
  sockaddr_un addr = make_address(socket_path);

  UnixSocket listener(open_stream_socket());

  // A previous acceptor that crashed leaves its socket file behind.
  if (::unlink(socket_path.c_str()) < 0 && errno != ENOENT) {
    throw_errno("unlink " + socket_path, errno);
  }
  if (::bind(listener.fd(), reinterpret_cast<const sockaddr *>(&addr),
             sizeof(addr)) < 0) {
    throw_errno("bind " + socket_path, errno);
  }
  if (::listen(listener.fd(), 1) < 0) {
    int err = errno;
    ::unlink(socket_path.c_str());
    throw_errno("listen " + socket_path, err);
  }

  broadcast_ipc::logging::debug("listening on " + socket_path);

  for (;;) {
    if (cancel.is_cancelled()) {
      ::unlink(socket_path.c_str());
      throw_cancelled("accept on " + socket_path);
    }

    pollfd pfd{};
    pfd.fd = listener.fd();
    pfd.events = POLLIN;
    int rc = ::poll(&pfd, 1, static_cast<int>(kCancelPollInterval.count()));
    if (rc < 0) {
      if (errno == EINTR) {
        continue;
      }
      int err = errno;
      ::unlink(socket_path.c_str());
      throw_errno("poll " + socket_path, err);
    }
    if (rc == 0) {
      continue;
    }

    int fd = ::accept4(listener.fd(), nullptr, nullptr, SOCK_CLOEXEC);
    if (fd < 0) {
      if (errno == EINTR || errno == EAGAIN || errno == ECONNABORTED) {
        continue;
      }
      int err = errno;
      ::unlink(socket_path.c_str());
      throw_errno("accept " + socket_path, err);
    }

    // Single expected peer: stop listening so later attempts are refused.
    listener.close();
    ::unlink(socket_path.c_str());
    broadcast_ipc::logging::info("accepted peer on " + socket_path);
    return UnixSocket(fd);
  }
}

UnixSocket connect_with_retry(const std::string &socket_path,
                              const CancelToken &cancel,
                              std::chrono::milliseconds retry_delay) {
  sockaddr_un addr = make_address(socket_path);
  bool logged_wait = false;

  for (;;) {
    if (cancel.is_cancelled()) {
      throw_cancelled("connect to " + socket_path);
    }

    UnixSocket sock(open_stream_socket());
    if (::connect(sock.fd(), reinterpret_cast<const sockaddr *>(&addr),
                  sizeof(addr)) == 0) {
      broadcast_ipc::logging::info("connected to " + socket_path);
      return sock;
    }

    int err = errno;
    if (err == EINTR) {
      continue;
    }
    if (!is_endpoint_missing(err)) {
      throw_errno("connect " + socket_path, err);
    }
    if (!logged_wait) {
      broadcast_ipc::logging::debug("waiting for acceptor on " + socket_path);
      logged_wait = true;
    }
    if (!sleep_unless_cancelled(retry_delay, cancel)) {
      throw_cancelled("connect to " + socket_path);
    }
  }
}

} // namespace transport
