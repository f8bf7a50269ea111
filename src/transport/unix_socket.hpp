#pragma once

#include <chrono>
#include <cstddef>
#include <cstdint>
#include <string>

#include "transport/cancel_token.hpp"

namespace transport {

// How often blocking establishment calls re-check their CancelToken.
constexpr std::chrono::milliseconds kCancelPollInterval{50};

// Owning wrapper around a connected AF_UNIX stream socket.
// Failures are reported as ChannelError.
class UnixSocket {
public:
  UnixSocket() = default;
  explicit UnixSocket(int fd) : fd_(fd) {}
  ~UnixSocket();

  UnixSocket(const UnixSocket &) = delete;
  UnixSocket &operator=(const UnixSocket &) = delete;
  UnixSocket(UnixSocket &&other) noexcept;
  UnixSocket &operator=(UnixSocket &&other) noexcept;

  bool valid() const { return fd_ >= 0; }
  int fd() const { return fd_; }

  // Writes all len bytes or throws. Never raises SIGPIPE.
  void write_all(const uint8_t *data, size_t len);

  // Reads up to max_len bytes, blocking until at least one is available.
  // Returns 0 when the peer closed the connection.
  size_t read_some(uint8_t *buf, size_t max_len);

  // Wakes up blocked readers and writers; the descriptor stays open.
  void shutdown() noexcept;

  void close() noexcept;

private:
  int fd_ = -1;
};

// Binds socket_path (replacing a stale socket file), waits for the first
// connection and stops listening. Later connection attempts are refused.
// Throws ChannelError(Cancelled) if cancel fires before a peer connects.
UnixSocket accept_first_connection(const std::string &socket_path,
                                   const CancelToken &cancel);

// Connects to socket_path. While the endpoint does not exist yet (or refuses
// connections) the attempt is retried every retry_delay.
// Throws ChannelError(Cancelled) on cancellation, ChannelError(Transport) on
// any other socket failure.
UnixSocket connect_with_retry(const std::string &socket_path,
                              const CancelToken &cancel,
                              std::chrono::milliseconds retry_delay);

} // namespace transport
