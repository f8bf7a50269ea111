#pragma once

#include <stdexcept>
#include <string>

namespace transport {

// Failure raised by channel establishment, send and receive.
class ChannelError : public std::runtime_error {
public:
  enum class Code {
    Cancelled,       // establishment abandoned before a peer arrived
    CorruptMessage,  // frame or header could not be decoded
    ConnectionClosed,
    MessageTooLarge, // refused locally before anything was written
    Transport        // socket failure, see sys_errno()
  };

  ChannelError(Code code, const std::string &message, int sys_errno = 0)
      : std::runtime_error(message), code_(code), sys_errno_(sys_errno) {}

  Code code() const noexcept { return code_; }
  int sys_errno() const noexcept { return sys_errno_; }

private:
  Code code_;
  int sys_errno_;
};

inline const char *to_string(ChannelError::Code code) {
  switch (code) {
  case ChannelError::Code::Cancelled:
    return "cancelled";
  case ChannelError::Code::CorruptMessage:
    return "corrupt_message";
  case ChannelError::Code::ConnectionClosed:
    return "connection_closed";
  case ChannelError::Code::MessageTooLarge:
    return "message_too_large";
  case ChannelError::Code::Transport:
    return "transport";
  }
  return "unknown";
}

} // namespace transport
