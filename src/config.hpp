#pragma once

#include <chrono>
#include <cstddef>
#include <cstdint>
#include <string>
#include <yaml-cpp/yaml.h>

#include "logging.hpp"

namespace broadcast_ipc {

// Local socket shared by both processes
struct IpcConfig {
  std::string socket_path = "/tmp/broadcast-ipc.sock";
  std::chrono::milliseconds restart_delay{100}; // connector retry backoff
  uint32_t max_message_bytes = 64u * 1024u * 1024u;
};

// Uploader/receiver behaviour
struct BroadcastConfig {
  bool wants_audio = false;
  double frame_rate_hz = 30.0;
  uint32_t width = 640;
  uint32_t height = 360;
};

// Data stream layer
struct DataStreamConfig {
  std::size_t chunk_size = 15000;
  std::string topic = "files";
  std::string output_directory = ".";
  std::string identity = "broadcast-ipc";
};

struct LoggingConfig {
  logging::Level level = logging::Level::Info;
};

// Complete application configuration
struct AppConfig {
  std::string config_file_path; // empty when built from defaults or a string
  IpcConfig ipc;
  BroadcastConfig broadcast;
  DataStreamConfig data_stream;
  LoggingConfig logging;
};

// Load configuration from YAML file
// Throws std::runtime_error if file cannot be read, parsed, or validated
AppConfig load_config(const std::string &path);

// Parse configuration from YAML text (missing sections keep defaults)
// Throws std::runtime_error on parse or validation failure
AppConfig load_config_content(const std::string &yaml_content);

// Validate an already-populated configuration
// Throws std::runtime_error describing the first invalid field
void validate_config(const AppConfig &config);

} // namespace broadcast_ipc
