#pragma once

#include <memory>
#include <optional>
#include <stdexcept>
#include <string>
#include <variant>

#include "broadcast/codecs.hpp"
#include "transport/cancel_token.hpp"
#include "transport/channel.hpp"

namespace broadcast {

class ReceiverError : public std::runtime_error {
public:
  enum class Code {
    MissingSampleData, // media header arrived without payload bytes
    UnexpectedMessage  // header carried no known variant
  };

  ReceiverError(Code code, const std::string &message)
      : std::runtime_error(message), code_(code) {}

  Code code() const noexcept { return code_; }

private:
  Code code_;
};

struct ImageSample {
  ImageFrame frame;
  v1::VideoRotation rotation = v1::VIDEO_ROTATION_0;
};

struct AudioSample {
  AudioFrame frame;
};

using IncomingSample = std::variant<ImageSample, AudioSample>;

// Receiving side of the broadcast channel (acceptor role).
// Any decode or transport error is terminal: the channel is closed and the
// error propagates from next_sample().
class Receiver {
public:
  Receiver(std::unique_ptr<transport::Channel> channel,
           std::unique_ptr<ImageCodec> image_codec,
           std::unique_ptr<AudioCodec> audio_codec);

  // Waits for the uploader on socket_path, with raw pass-through codecs.
  static std::unique_ptr<Receiver>
  accept(const std::string &socket_path, const transport::CancelToken &cancel,
         uint32_t max_message_bytes = transport::kMaxMessageBytes);

  // Blocks for the next decoded sample. nullopt once the uploader is gone.
  std::optional<IncomingSample> next_sample();

  // Tells the uploader whether to send audio.
  void set_wants_audio(bool wants_audio);

  void close() { channel_->close(); }
  bool is_closed() const { return channel_->is_closed(); }

private:
  std::optional<IncomingSample> decode(transport::Message<v1::IpcHeader> &msg);

  std::unique_ptr<transport::Channel> channel_;
  std::unique_ptr<ImageCodec> image_codec_;
  std::unique_ptr<AudioCodec> audio_codec_;
};

} // namespace broadcast
