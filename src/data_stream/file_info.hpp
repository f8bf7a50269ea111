#pragma once

#include <cstdint>
#include <optional>
#include <string>

namespace data_stream {

constexpr const char *kDefaultFileExtension = "bin";

struct FileInfo {
  std::string name;
  uint64_t size = 0;
  std::optional<std::string> mime_type;
};

// Name, size and extension-derived MIME type of a regular file.
// nullopt if path does not name a readable regular file.
std::optional<FileInfo> file_info(const std::string &path);

std::optional<std::string> mime_type_for_extension(const std::string &extension);
std::optional<std::string> preferred_extension(const std::string &mime_type);

// File name for a received byte stream: preferred_name if it already has an
// extension, otherwise preferred_name (or fallback_name) plus the extension
// derived from mime_type, "bin" if none is known.
std::string resolve_file_name(const std::optional<std::string> &preferred_name,
                              const std::string &fallback_name,
                              const std::string &mime_type);

} // namespace data_stream
