#include "config.hpp"

#include <filesystem>
#include <stdexcept>

namespace broadcast_ipc {

namespace fs = std::filesystem;

// Room in a chunk packet for the frame header, a generated stream id and the
// chunk index.
constexpr uint64_t kChunkPacketOverhead = 256;

template <typename T>
static T read_field(const YAML::Node &section, const char *section_name,
                    const char *key, const T &fallback) {
  const YAML::Node node = section[key];
  if (!node) {
    return fallback;
  }
  try {
    return node.as<T>();
  } catch (const YAML::Exception &e) {
    throw std::runtime_error(std::string("[CONFIG] Invalid ") + section_name +
                             "." + key + ": " + e.what());
  }
}

static YAML::Node section_of(const YAML::Node &root, const char *name) {
  const YAML::Node node = root[name];
  if (node && !node.IsMap()) {
    throw std::runtime_error(std::string("[CONFIG] '") + name +
                             "' section must be a map");
  }
  return node;
}

static void parse_ipc(const YAML::Node &node, IpcConfig &ipc) {
  if (!node) {
    return;
  }
  ipc.socket_path =
      read_field<std::string>(node, "ipc", "socket_path", ipc.socket_path);

  const int64_t delay_ms = read_field<int64_t>(
      node, "ipc", "restart_delay_ms", ipc.restart_delay.count());
  if (delay_ms < 1 || delay_ms > 10000) {
    throw std::runtime_error(
        "[CONFIG] ipc.restart_delay_ms must be in range [1, 10000]");
  }
  ipc.restart_delay = std::chrono::milliseconds(delay_ms);

  const uint64_t max_bytes = read_field<uint64_t>(
      node, "ipc", "max_message_bytes", ipc.max_message_bytes);
  if (max_bytes < 1024u || max_bytes > 1024u * 1024u * 1024u) {
    throw std::runtime_error(
        "[CONFIG] ipc.max_message_bytes must be in range [1024, 1073741824]");
  }
  ipc.max_message_bytes = static_cast<uint32_t>(max_bytes);
}

static void parse_broadcast(const YAML::Node &node, BroadcastConfig &bc) {
  if (!node) {
    return;
  }
  bc.wants_audio =
      read_field<bool>(node, "broadcast", "wants_audio", bc.wants_audio);
  bc.frame_rate_hz =
      read_field<double>(node, "broadcast", "frame_rate_hz", bc.frame_rate_hz);
  bc.width = read_field<uint32_t>(node, "broadcast", "width", bc.width);
  bc.height = read_field<uint32_t>(node, "broadcast", "height", bc.height);
}

static void parse_data_stream(const YAML::Node &node, DataStreamConfig &ds) {
  if (!node) {
    return;
  }
  ds.chunk_size =
      read_field<std::size_t>(node, "data_stream", "chunk_size", ds.chunk_size);
  ds.topic = read_field<std::string>(node, "data_stream", "topic", ds.topic);
  ds.output_directory = read_field<std::string>(
      node, "data_stream", "output_directory", ds.output_directory);
  ds.identity =
      read_field<std::string>(node, "data_stream", "identity", ds.identity);
}

static void parse_logging(const YAML::Node &node, LoggingConfig &lc) {
  if (!node) {
    return;
  }
  const std::string level = read_field<std::string>(
      node, "logging", "level", logging::to_string(lc.level));
  try {
    lc.level = logging::parse_level(level);
  } catch (const std::exception &e) {
    throw std::runtime_error("[CONFIG] Invalid logging.level: " +
                             std::string(e.what()));
  }
}

static AppConfig parse_root(const YAML::Node &root) {
  AppConfig config;
  if (!root || root.IsNull()) {
    return config;
  }
  if (!root.IsMap()) {
    throw std::runtime_error("[CONFIG] top level must be a map");
  }

  parse_ipc(section_of(root, "ipc"), config.ipc);
  parse_broadcast(section_of(root, "broadcast"), config.broadcast);
  parse_data_stream(section_of(root, "data_stream"), config.data_stream);
  parse_logging(section_of(root, "logging"), config.logging);

  validate_config(config);
  return config;
}

void validate_config(const AppConfig &config) {
  if (config.ipc.socket_path.empty()) {
    throw std::runtime_error("[CONFIG] ipc.socket_path must not be empty");
  }
  // sockaddr_un::sun_path is 108 bytes including the terminator
  if (config.ipc.socket_path.size() >= 108) {
    throw std::runtime_error(
        "[CONFIG] ipc.socket_path is too long for a unix socket (max 107)");
  }
  if (config.broadcast.frame_rate_hz <= 0.0 ||
      config.broadcast.frame_rate_hz > 240.0) {
    throw std::runtime_error(
        "[CONFIG] broadcast.frame_rate_hz must be in range (0, 240]");
  }
  if (config.broadcast.width == 0 || config.broadcast.height == 0) {
    throw std::runtime_error(
        "[CONFIG] broadcast.width and broadcast.height must be > 0");
  }
  if (config.data_stream.chunk_size == 0 ||
      config.data_stream.chunk_size > 1024u * 1024u) {
    throw std::runtime_error(
        "[CONFIG] data_stream.chunk_size must be in range [1, 1048576]");
  }
  if (config.data_stream.topic.empty()) {
    throw std::runtime_error("[CONFIG] data_stream.topic must not be empty");
  }
  // A chunk packet carries the content plus stream id, index, identity and
  // the frame header.
  const uint64_t chunk_packet_bytes = config.data_stream.chunk_size +
                                      config.data_stream.identity.size() +
                                      kChunkPacketOverhead;
  if (chunk_packet_bytes > config.ipc.max_message_bytes) {
    throw std::runtime_error(
        "[CONFIG] data_stream.chunk_size " +
        std::to_string(config.data_stream.chunk_size) +
        " does not fit in ipc.max_message_bytes " +
        std::to_string(config.ipc.max_message_bytes) + " (needs " +
        std::to_string(chunk_packet_bytes) + ")");
  }
}

AppConfig load_config(const std::string &path) {
  YAML::Node yaml;

  try {
    yaml = YAML::LoadFile(path);
  } catch (const YAML::Exception &e) {
    throw std::runtime_error("Failed to load config file '" + path +
                             "': " + e.what());
  }

  AppConfig config = parse_root(yaml);
  config.config_file_path = fs::absolute(path).string();
  return config;
}

AppConfig load_config_content(const std::string &yaml_content) {
  YAML::Node yaml;

  try {
    yaml = YAML::Load(yaml_content);
  } catch (const YAML::Exception &e) {
    throw std::runtime_error("Failed to parse config: " +
                             std::string(e.what()));
  }

  return parse_root(yaml);
}

} // namespace broadcast_ipc
