#include "broadcast/uploader.hpp"

#include "logging.hpp"

namespace broadcast {

namespace logging = ::broadcast_ipc::logging;

namespace {

v1::IpcHeader image_header(const EncodedImage &encoded,
                           v1::VideoRotation rotation) {
  v1::IpcHeader header;
  auto *image = header.mutable_image();
  *image->mutable_metadata() = encoded.metadata;
  image->set_rotation(rotation);
  return header;
}

} // namespace

Uploader::Uploader(std::unique_ptr<transport::Channel> channel,
                   std::unique_ptr<ImageCodec> image_codec,
                   std::unique_ptr<AudioCodec> audio_codec)
    : channel_(std::move(channel)), image_codec_(std::move(image_codec)),
      audio_codec_(std::move(audio_codec)) {
  send_thread_ = std::make_unique<std::thread>(&Uploader::send_thread, this);
  listen_thread_ =
      std::make_unique<std::thread>(&Uploader::listen_thread, this);
}

Uploader::~Uploader() { close(); }

std::unique_ptr<Uploader>
Uploader::connect(const std::string &socket_path,
                  const transport::CancelToken &cancel,
                  std::chrono::milliseconds restart_delay,
                  uint32_t max_message_bytes) {
  auto channel = transport::Channel::connect(socket_path, cancel, restart_delay,
                                             max_message_bytes);
  return std::make_unique<Uploader>(std::move(channel),
                                    std::make_unique<RawImageCodec>(),
                                    std::make_unique<PcmAudioCodec>());
}

bool Uploader::upload_image(const ImageFrame &frame,
                            v1::VideoRotation rotation) {
  ensure_open();
  if (!image_gate_.try_acquire()) {
    logging::debug("image still in flight, dropping frame");
    return false;
  }
  auto lease = std::make_shared<GateLease>(image_gate_);

  // Encoding failures release the gate through the lease.
  EncodedImage encoded = image_codec_->encode(frame);
  auto header = std::make_shared<v1::IpcHeader>(image_header(encoded, rotation));
  auto payload = std::make_shared<std::vector<uint8_t>>(std::move(encoded.bytes));

  enqueue([this, lease, header, payload]() {
    try {
      channel_->send(*header, payload.get());
    } catch (const transport::ChannelError &e) {
      logging::warn(std::string("image upload failed: ") + e.what());
    }
  });
  return true;
}

bool Uploader::upload_audio(const AudioFrame &frame) {
  ensure_open();
  if (!wants_audio()) {
    return false;
  }

  EncodedAudio encoded = audio_codec_->encode(frame);
  auto header = std::make_shared<v1::IpcHeader>();
  *header->mutable_audio()->mutable_metadata() = encoded.metadata;
  auto payload = std::make_shared<std::vector<uint8_t>>(std::move(encoded.bytes));

  enqueue([this, header, payload]() {
    try {
      channel_->send(*header, payload.get());
    } catch (const transport::ChannelError &e) {
      logging::warn(std::string("audio upload failed: ") + e.what());
    }
  });
  return true;
}

void Uploader::send_image(const ImageFrame &frame, v1::VideoRotation rotation) {
  ensure_open();
  EncodedImage encoded = image_codec_->encode(frame);
  channel_->send(image_header(encoded, rotation), &encoded.bytes);
}

void Uploader::close() {
  std::call_once(close_once_, [this]() {
    channel_->close();
    {
      std::lock_guard<std::mutex> lock(queue_mutex_);
      stopping_ = true;
      queue_.clear();
    }
    queue_cv_.notify_all();

    if (send_thread_ && send_thread_->joinable()) {
      send_thread_->join();
    }
    if (listen_thread_ && listen_thread_->joinable()) {
      listen_thread_->join();
    }
  });
}

void Uploader::ensure_open() const {
  if (channel_->is_closed()) {
    throw transport::ChannelError(transport::ChannelError::Code::ConnectionClosed,
                                  "uploader channel is closed");
  }
}

void Uploader::enqueue(Task task) {
  {
    std::lock_guard<std::mutex> lock(queue_mutex_);
    if (stopping_) {
      return;
    }
    queue_.push_back(std::move(task));
  }
  queue_cv_.notify_one();
}

void Uploader::send_thread() {
  for (;;) {
    Task task;
    {
      std::unique_lock<std::mutex> lock(queue_mutex_);
      queue_cv_.wait(lock, [this]() { return stopping_ || !queue_.empty(); });
      if (stopping_) {
        return;
      }
      task = std::move(queue_.front());
      queue_.pop_front();
    }
    task();
  }
}

void Uploader::listen_thread() {
  try {
    while (auto msg = channel_->receive<v1::IpcHeader>()) {
      if (msg->header.kind_case() == v1::IpcHeader::kWantsAudio) {
        bool wanted = msg->header.wants_audio();
        if (wants_audio_.exchange(wanted) != wanted) {
          logging::info(wanted ? "receiver requested audio"
                               : "receiver stopped audio");
        }
      } else {
        logging::debug("uploader ignoring message kind " +
                       std::to_string(msg->header.kind_case()));
      }
    }
  } catch (const transport::ChannelError &e) {
    logging::warn(std::string("uploader channel failed: ") + e.what());
  }
  logging::debug("uploader listener stopped");
}

} // namespace broadcast
