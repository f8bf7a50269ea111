#include <atomic>
#include <chrono>
#include <csignal>
#include <cstdint>
#include <functional>
#include <iostream>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <thread>
#include <variant>
#include <vector>

#include "broadcast/receiver.hpp"
#include "broadcast/uploader.hpp"
#include "config.hpp"
#include "data_stream/channel_link.hpp"
#include "logging.hpp"
#include "transport/cancel_token.hpp"
#include "transport/channel.hpp"

namespace logging = broadcast_ipc::logging;

static std::atomic<bool> g_interrupted{false};

static void on_signal(int) { g_interrupted.store(true); }

static void print_usage() {
  std::cerr << "Usage: broadcast-ipc --config <path/to/config.yaml> --role "
               "<receiver|uploader|stream-receive|stream-send>\n"
               "                     [--socket <path>] [--duration <sec>]\n"
               "                     [--file <path>] [--text <string>]\n";
}

// Fires once when SIGINT/SIGTERM arrives or the run duration elapses:
// cancels pending connection setup and runs the registered closer.
class StopSignal {
public:
  explicit StopSignal(double duration_sec) : duration_sec_(duration_sec) {
    watcher_ = std::thread(&StopSignal::watch, this);
  }

  ~StopSignal() {
    done_.store(true);
    if (watcher_.joinable()) {
      watcher_.join();
    }
  }

  const transport::CancelToken &token() const { return token_; }

  // Runs closer immediately if the stop already fired.
  void on_stop(std::function<void()> closer) {
    std::lock_guard<std::mutex> lock(mutex_);
    if (fired_) {
      closer();
      return;
    }
    closer_ = std::move(closer);
  }

  void clear_on_stop() {
    std::lock_guard<std::mutex> lock(mutex_);
    closer_ = nullptr;
  }

  bool fired() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return fired_;
  }

private:
  void watch() {
    const auto start = std::chrono::steady_clock::now();
    while (!done_.load()) {
      std::this_thread::sleep_for(transport::kCancelPollInterval);
      const double elapsed =
          std::chrono::duration<double>(std::chrono::steady_clock::now() - start)
              .count();
      const bool expired = duration_sec_ > 0.0 && elapsed >= duration_sec_;
      if (g_interrupted.load() || expired) {
        logging::info(expired ? "run duration elapsed, stopping"
                              : "interrupted, stopping");
        token_.cancel();
        std::lock_guard<std::mutex> lock(mutex_);
        fired_ = true;
        if (closer_) {
          closer_();
        }
        return;
      }
    }
  }

  double duration_sec_;
  transport::CancelToken token_;
  mutable std::mutex mutex_;
  std::function<void()> closer_;
  bool fired_ = false;
  std::atomic<bool> done_{false};
  std::thread watcher_;
};

// Keeps a closer registered for as long as the object it closes is alive.
class ScopedCloser {
public:
  ScopedCloser(StopSignal &stop, std::function<void()> closer) : stop_(stop) {
    stop_.on_stop(std::move(closer));
  }
  ~ScopedCloser() { stop_.clear_on_stop(); }

  ScopedCloser(const ScopedCloser &) = delete;
  ScopedCloser &operator=(const ScopedCloser &) = delete;

private:
  StopSignal &stop_;
};

// -----------------------------
// Roles
// -----------------------------

static int run_receiver(const broadcast_ipc::AppConfig &config,
                        StopSignal &stop) {
  auto receiver = broadcast::Receiver::accept(
      config.ipc.socket_path, stop.token(), config.ipc.max_message_bytes);
  ScopedCloser closer(stop, [&receiver]() { receiver->close(); });

  if (config.broadcast.wants_audio) {
    receiver->set_wants_audio(true);
  }

  uint64_t images = 0;
  uint64_t audio = 0;
  while (auto sample = receiver->next_sample()) {
    if (auto *image = std::get_if<broadcast::ImageSample>(&*sample)) {
      ++images;
      logging::debug("image " + std::to_string(image->frame.width) + "x" +
                     std::to_string(image->frame.height) + " rotation " +
                     std::to_string(image->rotation));
    } else {
      ++audio;
    }
  }
  logging::info("receiver done: " + std::to_string(images) + " images, " +
                std::to_string(audio) + " audio buffers");
  return 0;
}

static broadcast::ImageFrame test_pattern(uint32_t width, uint32_t height,
                                          uint64_t frame_no) {
  broadcast::ImageFrame frame;
  frame.width = width;
  frame.height = height;
  frame.pixels.resize(static_cast<size_t>(width) * height *
                      broadcast::kBytesPerPixel);
  const auto shift = static_cast<uint8_t>(frame_no * 4);
  size_t i = 0;
  for (uint32_t y = 0; y < height; ++y) {
    for (uint32_t x = 0; x < width; ++x) {
      frame.pixels[i++] = static_cast<uint8_t>(x + shift); // B
      frame.pixels[i++] = static_cast<uint8_t>(y);         // G
      frame.pixels[i++] = shift;                            // R
      frame.pixels[i++] = 0xFF;                             // A
    }
  }
  return frame;
}

static int run_uploader(const broadcast_ipc::AppConfig &config,
                        StopSignal &stop) {
  auto uploader = broadcast::Uploader::connect(
      config.ipc.socket_path, stop.token(), config.ipc.restart_delay,
      config.ipc.max_message_bytes);
  ScopedCloser closer(stop, [&uploader]() { uploader->close(); });

  const auto period = std::chrono::duration_cast<std::chrono::nanoseconds>(
      std::chrono::duration<double>(1.0 / config.broadcast.frame_rate_hz));

  // 48 kHz stereo 16-bit silence, one buffer per video frame.
  broadcast::AudioFrame silence;
  silence.format = broadcast::make_pcm_format(48000.0, 2, 16);
  silence.sample_count =
      static_cast<int32_t>(48000.0 / config.broadcast.frame_rate_hz);
  if (silence.sample_count < 1) {
    silence.sample_count = 1;
  }
  silence.samples.assign(static_cast<size_t>(silence.sample_count) *
                             silence.format.bytes_per_frame(),
                         0);

  uint64_t sent = 0;
  uint64_t dropped = 0;
  uint64_t audio = 0;
  auto next_tick = std::chrono::steady_clock::now();
  try {
    for (uint64_t frame_no = 0; !stop.fired() && !uploader->is_closed();
         ++frame_no) {
      auto frame =
          test_pattern(config.broadcast.width, config.broadcast.height, frame_no);
      if (uploader->upload_image(frame)) {
        ++sent;
      } else {
        ++dropped;
      }
      if (uploader->upload_audio(silence)) {
        ++audio;
      }
      next_tick += period;
      std::this_thread::sleep_until(next_tick);
    }
  } catch (const transport::ChannelError &e) {
    if (e.code() != transport::ChannelError::Code::ConnectionClosed) {
      throw;
    }
  }

  logging::info("uploader done: " + std::to_string(sent) + " images sent, " +
                std::to_string(dropped) + " dropped, " + std::to_string(audio) +
                " audio buffers");
  return 0;
}

static int run_stream_receive(const broadcast_ipc::AppConfig &config,
                              StopSignal &stop) {
  auto channel = transport::Channel::accept(config.ipc.socket_path, stop.token(),
                                            config.ipc.max_message_bytes);
  data_stream::ChannelLink link(std::move(channel), config.data_stream.identity,
                                config.data_stream.chunk_size);
  ScopedCloser closer(stop, [&link]() { link.close(); });

  const std::string output_directory = config.data_stream.output_directory;
  link.incoming().register_byte_stream_handler(
      config.data_stream.topic,
      [output_directory](data_stream::ByteStreamReader reader,
                         const std::string &from) {
        const std::string path = reader.write_to_file(output_directory);
        logging::info("received file from '" + from + "': " + path);
      });
  link.incoming().register_text_stream_handler(
      config.data_stream.topic,
      [](data_stream::TextStreamReader reader, const std::string &from) {
        const std::string text = reader.read_all();
        logging::info("received text from '" + from + "' (" +
                      std::to_string(text.size()) + " bytes): " + text);
      });

  link.start();
  link.wait();
  return 0;
}

static int run_stream_send(const broadcast_ipc::AppConfig &config,
                           StopSignal &stop,
                           const std::optional<std::string> &file,
                           const std::optional<std::string> &text) {
  auto channel = transport::Channel::connect(
      config.ipc.socket_path, stop.token(), config.ipc.restart_delay,
      config.ipc.max_message_bytes);
  data_stream::ChannelLink link(std::move(channel), config.data_stream.identity,
                                config.data_stream.chunk_size);
  ScopedCloser closer(stop, [&link]() { link.close(); });
  link.start();

  if (file) {
    data_stream::StreamByteOptions options;
    options.topic = config.data_stream.topic;
    auto info = link.outgoing().send_file(*file, options);
    logging::info("sent file '" + info.name.value_or(info.id) + "' as stream " +
                  info.id);
  }
  if (text) {
    data_stream::StreamTextOptions options;
    options.topic = config.data_stream.topic;
    auto info = link.outgoing().send_text(*text, options);
    logging::info("sent text as stream " + info.id);
  }

  link.close();
  return 0;
}

int main(int argc, char **argv) {
  std::optional<std::string> config_path;
  std::optional<std::string> role;
  std::optional<std::string> socket_override;
  std::optional<std::string> file;
  std::optional<std::string> text;
  double duration_sec = 0.0;

  for (int i = 1; i < argc; ++i) {
    std::string arg = argv[i];

    if (arg == "--config" && i + 1 < argc) {
      config_path = argv[++i];
    } else if (arg == "--role" && i + 1 < argc) {
      role = argv[++i];
    } else if (arg == "--socket" && i + 1 < argc) {
      socket_override = argv[++i];
    } else if (arg == "--duration" && i + 1 < argc) {
      try {
        duration_sec = std::stod(argv[++i]);
      } catch (const std::exception &) {
        logging::error("invalid --duration value");
        return 1;
      }
    } else if (arg == "--file" && i + 1 < argc) {
      file = argv[++i];
    } else if (arg == "--text" && i + 1 < argc) {
      text = argv[++i];
    } else if (arg == "--help" || arg == "-h") {
      print_usage();
      return 0;
    } else {
      logging::error("unknown argument: " + arg);
      print_usage();
      return 1;
    }
  }

  if (!config_path || !role) {
    logging::error("--config and --role are required");
    print_usage();
    return 1;
  }
  if (*role != "receiver" && *role != "uploader" && *role != "stream-receive" &&
      *role != "stream-send") {
    logging::error("unknown role '" + *role + "'");
    print_usage();
    return 1;
  }
  if (*role == "stream-send" && !file && !text) {
    logging::error("stream-send needs --file and/or --text");
    return 1;
  }

  broadcast_ipc::AppConfig config;
  try {
    config = broadcast_ipc::load_config(*config_path);
    if (socket_override) {
      config.ipc.socket_path = *socket_override;
      broadcast_ipc::validate_config(config);
    }
  } catch (const std::exception &e) {
    logging::error(std::string("failed to load configuration: ") + e.what());
    return 1;
  }
  logging::set_level(config.logging.level);
  logging::info("role " + *role + " on " + config.ipc.socket_path);

  std::signal(SIGINT, on_signal);
  std::signal(SIGTERM, on_signal);

  StopSignal stop(duration_sec);
  try {
    if (*role == "receiver") {
      return run_receiver(config, stop);
    }
    if (*role == "uploader") {
      return run_uploader(config, stop);
    }
    if (*role == "stream-receive") {
      return run_stream_receive(config, stop);
    }
    return run_stream_send(config, stop, file, text);
  } catch (const transport::ChannelError &e) {
    if (e.code() == transport::ChannelError::Code::Cancelled) {
      logging::info(std::string("stopped before a peer connected: ") + e.what());
      return 0;
    }
    logging::error(std::string("channel error: ") + e.what());
    return 2;
  } catch (const std::exception &e) {
    logging::error(e.what());
    return 2;
  }
}
