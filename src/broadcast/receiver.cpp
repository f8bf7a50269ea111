#include "broadcast/receiver.hpp"

#include "logging.hpp"

namespace broadcast {

namespace logging = ::broadcast_ipc::logging;

Receiver::Receiver(std::unique_ptr<transport::Channel> channel,
                   std::unique_ptr<ImageCodec> image_codec,
                   std::unique_ptr<AudioCodec> audio_codec)
    : channel_(std::move(channel)), image_codec_(std::move(image_codec)),
      audio_codec_(std::move(audio_codec)) {}

std::unique_ptr<Receiver>
Receiver::accept(const std::string &socket_path,
                 const transport::CancelToken &cancel,
                 uint32_t max_message_bytes) {
  auto channel =
      transport::Channel::accept(socket_path, cancel, max_message_bytes);
  return std::make_unique<Receiver>(std::move(channel),
                                    std::make_unique<RawImageCodec>(),
                                    std::make_unique<PcmAudioCodec>());
}

std::optional<IncomingSample> Receiver::next_sample() {
  try {
    while (auto msg = channel_->receive<v1::IpcHeader>()) {
      if (auto sample = decode(*msg)) {
        return sample;
      }
    }
    return std::nullopt;
  } catch (...) {
    // A bad message means the stream is out of sync; stop reading.
    channel_->close();
    throw;
  }
}

void Receiver::set_wants_audio(bool wants_audio) {
  v1::IpcHeader header;
  header.set_wants_audio(wants_audio);
  channel_->send(header);
}

std::optional<IncomingSample>
Receiver::decode(transport::Message<v1::IpcHeader> &msg) {
  switch (msg.header.kind_case()) {
  case v1::IpcHeader::kImage: {
    if (!msg.payload) {
      throw ReceiverError(ReceiverError::Code::MissingSampleData,
                          "image message without sample data");
    }
    ImageSample sample;
    sample.frame =
        image_codec_->decode(*msg.payload, msg.header.image().metadata());
    sample.rotation = msg.header.image().rotation();
    return IncomingSample(std::move(sample));
  }
  case v1::IpcHeader::kAudio: {
    if (!msg.payload) {
      throw ReceiverError(ReceiverError::Code::MissingSampleData,
                          "audio message without sample data");
    }
    AudioSample sample;
    sample.frame =
        audio_codec_->decode(*msg.payload, msg.header.audio().metadata());
    return IncomingSample(std::move(sample));
  }
  case v1::IpcHeader::kWantsAudio:
    logging::debug("receiver ignoring wants_audio from uploader");
    return std::nullopt;
  case v1::IpcHeader::KIND_NOT_SET:
    break;
  }
  throw ReceiverError(ReceiverError::Code::UnexpectedMessage,
                      "message header has no known kind");
}

} // namespace broadcast
