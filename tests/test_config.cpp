#include <doctest/doctest.h>

#include <fstream>
#include <stdexcept>
#include <string>

#include "config.hpp"
#include "test_support.hpp"

using namespace broadcast_ipc;

namespace {

std::string config_error(const std::string &yaml) {
  try {
    load_config_content(yaml);
  } catch (const std::runtime_error &e) {
    return e.what();
  }
  FAIL("expected a configuration error");
  return "";
}

} // namespace

TEST_CASE("empty configuration yields defaults") {
  auto config = load_config_content("");
  CHECK(config.ipc.socket_path == "/tmp/broadcast-ipc.sock");
  CHECK(config.ipc.restart_delay == std::chrono::milliseconds(100));
  CHECK(config.ipc.max_message_bytes == 64u * 1024u * 1024u);
  CHECK_FALSE(config.broadcast.wants_audio);
  CHECK(config.data_stream.chunk_size == 15000);
  CHECK(config.data_stream.topic == "files");
  CHECK(config.logging.level == logging::Level::Info);
  CHECK(config.config_file_path.empty());
}

TEST_CASE("sections override only the fields they name") {
  auto config = load_config_content(R"(
ipc:
  socket_path: /tmp/custom.sock
  restart_delay_ms: 250
broadcast:
  wants_audio: true
  width: 1280
data_stream:
  chunk_size: 4096
  identity: camera-1
logging:
  level: warning
)");
  CHECK(config.ipc.socket_path == "/tmp/custom.sock");
  CHECK(config.ipc.restart_delay == std::chrono::milliseconds(250));
  CHECK(config.broadcast.wants_audio);
  CHECK(config.broadcast.width == 1280);
  CHECK(config.broadcast.height == 360);
  CHECK(config.data_stream.chunk_size == 4096);
  CHECK(config.data_stream.identity == "camera-1");
  CHECK(config.data_stream.topic == "files");
  CHECK(config.logging.level == logging::Level::Warn);
}

TEST_CASE("invalid values are reported with the field name") {
  CHECK(config_error("ipc:\n  restart_delay_ms: 0\n").find("[CONFIG] ipc.restart_delay_ms") !=
        std::string::npos);
  CHECK(config_error("ipc:\n  max_message_bytes: 10\n").find("max_message_bytes") !=
        std::string::npos);
  CHECK(config_error("ipc:\n  socket_path: \"\"\n").find("socket_path") !=
        std::string::npos);
  CHECK(config_error("ipc:\n  socket_path: /tmp/" + std::string(120, 'x') + "\n")
            .find("too long") != std::string::npos);
  CHECK(config_error("broadcast:\n  frame_rate_hz: 0\n").find("frame_rate_hz") !=
        std::string::npos);
  CHECK(config_error("broadcast:\n  wants_audio: maybe\n")
            .find("[CONFIG] Invalid broadcast.wants_audio") != std::string::npos);
  CHECK(config_error("data_stream:\n  chunk_size: 0\n").find("chunk_size") !=
        std::string::npos);
  CHECK(config_error("logging:\n  level: loud\n").find("[CONFIG] Invalid logging.level") !=
        std::string::npos);
  CHECK(config_error("ipc: 5\n").find("'ipc' section must be a map") !=
        std::string::npos);
  CHECK(config_error("- a\n- b\n").find("top level must be a map") !=
        std::string::npos);
}

TEST_CASE("chunk size must fit in a message") {
  CHECK(config_error("ipc:\n  max_message_bytes: 4096\n"
                     "data_stream:\n  chunk_size: 15000\n")
            .find("[CONFIG] data_stream.chunk_size 15000 does not fit") !=
        std::string::npos);
  CHECK(config_error("ipc:\n  max_message_bytes: 1024\n")
            .find("does not fit in ipc.max_message_bytes 1024") !=
        std::string::npos);

  auto config = load_config_content("ipc:\n  max_message_bytes: 4096\n"
                                    "data_stream:\n  chunk_size: 2048\n");
  CHECK(config.data_stream.chunk_size == 2048);
  CHECK(config.ipc.max_message_bytes == 4096);
}

TEST_CASE("validate_config checks overridden fields") {
  AppConfig config;
  CHECK_NOTHROW(validate_config(config));
  config.ipc.socket_path.clear();
  CHECK_THROWS_AS(validate_config(config), std::runtime_error);
}

TEST_CASE("load_config reads a file and records its path") {
  test_support::TempDir dir;
  const auto path = dir.path() / "config.yaml";
  {
    std::ofstream out(path);
    out << "data_stream:\n  topic: uploads\n";
  }
  auto config = load_config(path.string());
  CHECK(config.data_stream.topic == "uploads");
  CHECK(config.config_file_path == std::filesystem::absolute(path).string());

  CHECK_THROWS_AS(load_config((dir.path() / "missing.yaml").string()),
                  std::runtime_error);
}

TEST_CASE("log level names") {
  CHECK(logging::parse_level("debug") == logging::Level::Debug);
  CHECK(logging::parse_level("error") == logging::Level::Error);
  CHECK_THROWS_AS(logging::parse_level("verbose"), std::runtime_error);
  CHECK(std::string(logging::to_string(logging::Level::Warn)) == "warn");
}
