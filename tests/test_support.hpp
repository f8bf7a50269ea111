#pragma once

#include <atomic>
#include <cerrno>
#include <chrono>
#include <cstring>
#include <filesystem>
#include <functional>
#include <future>
#include <memory>
#include <stdexcept>
#include <string>
#include <thread>
#include <utility>

#include <sys/socket.h>
#include <unistd.h>

#include "transport/channel.hpp"
#include "transport/unix_socket.hpp"

namespace test_support {

inline std::string unique_suffix() {
  static std::atomic<int> counter{0};
  return std::to_string(::getpid()) + "-" + std::to_string(counter++);
}

// Short enough for sockaddr_un.
inline std::string unique_socket_path(const std::string &tag) {
  return "/tmp/bipc-" + tag + "-" + unique_suffix() + ".sock";
}

// Fresh empty directory, removed when the object goes away.
class TempDir {
public:
  TempDir()
      : path_(std::filesystem::temp_directory_path() /
              ("bipc-test-" + unique_suffix())) {
    std::filesystem::create_directories(path_);
  }
  ~TempDir() {
    std::error_code ec;
    std::filesystem::remove_all(path_, ec);
  }
  const std::filesystem::path &path() const { return path_; }

private:
  std::filesystem::path path_;
};

inline std::pair<transport::UnixSocket, transport::UnixSocket> socket_pair() {
  int fds[2];
  if (::socketpair(AF_UNIX, SOCK_STREAM | SOCK_CLOEXEC, 0, fds) != 0) {
    throw std::runtime_error(std::string("socketpair: ") + std::strerror(errno));
  }
  return {transport::UnixSocket(fds[0]), transport::UnixSocket(fds[1])};
}

struct ChannelPair {
  std::unique_ptr<transport::Channel> acceptor;
  std::unique_ptr<transport::Channel> connector;
};

// Two channels joined by an anonymous socket pair.
inline ChannelPair channel_pair(uint32_t max_message_bytes = transport::kMaxMessageBytes) {
  auto sockets = socket_pair();
  ChannelPair pair;
  pair.acceptor = std::make_unique<transport::Channel>(
      transport::Channel::Role::Acceptor, std::move(sockets.first),
      max_message_bytes);
  pair.connector = std::make_unique<transport::Channel>(
      transport::Channel::Role::Connector, std::move(sockets.second),
      max_message_bytes);
  return pair;
}

// Polls cond until it holds or timeout elapses.
inline bool wait_for(const std::function<bool()> &cond,
                     std::chrono::milliseconds timeout = std::chrono::seconds(2)) {
  const auto deadline = std::chrono::steady_clock::now() + timeout;
  while (std::chrono::steady_clock::now() < deadline) {
    if (cond()) {
      return true;
    }
    std::this_thread::sleep_for(std::chrono::milliseconds(5));
  }
  return cond();
}

inline std::vector<uint8_t> pattern_bytes(size_t n, uint8_t seed = 0) {
  std::vector<uint8_t> out(n);
  for (size_t i = 0; i < n; ++i) {
    out[i] = static_cast<uint8_t>((i * 31 + seed) & 0xFF);
  }
  return out;
}

} // namespace test_support
