#include "logging.hpp"

#include <atomic>
#include <iostream>
#include <mutex>
#include <stdexcept>

namespace broadcast_ipc {
namespace logging {

static std::atomic<int> g_min_level{static_cast<int>(Level::Info)};

static std::mutex &output_mutex() {
  static std::mutex m;
  return m;
}

void set_level(Level level) {
  g_min_level.store(static_cast<int>(level), std::memory_order_relaxed);
}

Level level() {
  return static_cast<Level>(g_min_level.load(std::memory_order_relaxed));
}

Level parse_level(const std::string &name) {
  if (name == "debug") {
    return Level::Debug;
  } else if (name == "info") {
    return Level::Info;
  } else if (name == "warn" || name == "warning") {
    return Level::Warn;
  } else if (name == "error") {
    return Level::Error;
  } else {
    throw std::runtime_error("Invalid log level: '" + name +
                             "'. Valid values: debug, info, warn, error");
  }
}

const char *to_string(Level level) {
  switch (level) {
  case Level::Debug:
    return "debug";
  case Level::Info:
    return "info";
  case Level::Warn:
    return "warn";
  case Level::Error:
    return "error";
  }
  return "info";
}

void write(Level lvl, const std::string &msg) {
  if (static_cast<int>(lvl) < g_min_level.load(std::memory_order_relaxed)) {
    return;
  }
  std::lock_guard<std::mutex> lock(output_mutex());
  std::cerr << "broadcast-ipc: [" << to_string(lvl) << "] " << msg << "\n";
}

} // namespace logging
} // namespace broadcast_ipc
