#pragma once

#include <stdexcept>
#include <string>

namespace data_stream {

// Errors scoped to a single logical stream.
class StreamError : public std::runtime_error {
public:
  enum class Code {
    AlreadyOpened,
    UnknownStream,
    Terminated,     // manager gone while the stream was in use
    LengthExceeded, // more bytes than the declared total length
    Incomplete,     // fewer bytes than the declared total length
    HandlerAlreadyRegistered,
    DecodeFailed,   // text stream content is not valid UTF-8
    AbnormalEnd,    // sender closed the stream with a reason
    NotDirectory,
    FileInfoUnavailable
  };

  explicit StreamError(Code code, const std::string &reason = {})
      : std::runtime_error(describe(code, reason)), code_(code),
        reason_(reason) {}

  Code code() const noexcept { return code_; }

  // Closure reason for AbnormalEnd, or the offending path for file errors.
  const std::string &reason() const noexcept { return reason_; }

  static std::string describe(Code code, const std::string &reason) {
    switch (code) {
    case Code::AlreadyOpened:
      return "stream already opened";
    case Code::UnknownStream:
      return "unknown stream";
    case Code::Terminated:
      return "stream terminated";
    case Code::LengthExceeded:
      return "stream length exceeded";
    case Code::Incomplete:
      return "stream incomplete";
    case Code::HandlerAlreadyRegistered:
      return "handler already registered";
    case Code::DecodeFailed:
      return "stream content is not valid UTF-8";
    case Code::AbnormalEnd:
      return "stream ended abnormally: " + reason;
    case Code::NotDirectory:
      return "not a directory: " + reason;
    case Code::FileInfoUnavailable:
      return "file info unavailable: " + reason;
    }
    return "stream error";
  }

private:
  Code code_;
  std::string reason_;
};

} // namespace data_stream
