#pragma once

#include <string>

namespace broadcast_ipc {
namespace logging {

enum class Level { Debug = 0, Info, Warn, Error };

// Process-wide minimum level. Messages below it are dropped.
void set_level(Level level);
Level level();

// Throws std::runtime_error on an unknown level name.
Level parse_level(const std::string &name);
const char *to_string(Level level);

// Writes "broadcast-ipc: [level] msg" to stderr. Safe to call from any thread.
void write(Level level, const std::string &msg);

inline void debug(const std::string &msg) { write(Level::Debug, msg); }
inline void info(const std::string &msg) { write(Level::Info, msg); }
inline void warn(const std::string &msg) { write(Level::Warn, msg); }
inline void error(const std::string &msg) { write(Level::Error, msg); }

} // namespace logging
} // namespace broadcast_ipc
