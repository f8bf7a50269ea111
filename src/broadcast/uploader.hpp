#pragma once

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <deque>
#include <functional>
#include <memory>
#include <mutex>
#include <string>
#include <thread>

#include "broadcast/codecs.hpp"
#include "broadcast/in_flight_gate.hpp"
#include "transport/cancel_token.hpp"
#include "transport/channel.hpp"

namespace broadcast {

/**
 * @brief Sending side of the broadcast channel (connector role).
 *
 * Images go through an in-flight gate: while one image is being written, new
 * images are dropped instead of queued. Audio is only sent after the receiver
 * asked for it and is not gated.
 *
 * Fire-and-forget sends run on a worker thread; their failures are logged.
 * A second thread listens for capability messages from the receiver.
 */
class Uploader {
public:
  Uploader(std::unique_ptr<transport::Channel> channel,
           std::unique_ptr<ImageCodec> image_codec,
           std::unique_ptr<AudioCodec> audio_codec);
  ~Uploader();

  Uploader(const Uploader &) = delete;
  Uploader &operator=(const Uploader &) = delete;

  // Connects to the receiver with raw pass-through codecs.
  static std::unique_ptr<Uploader>
  connect(const std::string &socket_path, const transport::CancelToken &cancel,
          std::chrono::milliseconds restart_delay = transport::kRestartDelay,
          uint32_t max_message_bytes = transport::kMaxMessageBytes);

  // Returns false if the frame was dropped because an earlier image is still
  // in flight. Encoding errors throw CodecError; a closed uploader throws
  // ChannelError(ConnectionClosed).
  bool upload_image(const ImageFrame &frame,
                    v1::VideoRotation rotation = v1::VIDEO_ROTATION_0);

  // Returns false if the receiver has not asked for audio.
  bool upload_audio(const AudioFrame &frame);

  // Encodes and writes one image on the calling thread. Send failures
  // propagate as ChannelError.
  void send_image(const ImageFrame &frame,
                  v1::VideoRotation rotation = v1::VIDEO_ROTATION_0);

  bool wants_audio() const { return wants_audio_.load(); }
  bool image_in_flight() const { return image_gate_.busy(); }

  // Idempotent. Pending fire-and-forget sends are discarded.
  void close();
  bool is_closed() const { return channel_->is_closed(); }

private:
  using Task = std::function<void()>;

  void ensure_open() const;
  void enqueue(Task task);
  void send_thread();
  void listen_thread();

  std::unique_ptr<transport::Channel> channel_;
  std::unique_ptr<ImageCodec> image_codec_;
  std::unique_ptr<AudioCodec> audio_codec_;

  InFlightGate image_gate_;
  std::atomic<bool> wants_audio_{false};

  std::mutex queue_mutex_;
  std::condition_variable queue_cv_;
  std::deque<Task> queue_;
  bool stopping_ = false;

  std::once_flag close_once_;
  std::unique_ptr<std::thread> send_thread_;
  std::unique_ptr<std::thread> listen_thread_;
};

} // namespace broadcast
