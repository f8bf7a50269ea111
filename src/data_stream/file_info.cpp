#include "data_stream/file_info.hpp"

#include <algorithm>
#include <cctype>
#include <filesystem>
#include <system_error>

namespace fs = std::filesystem;

namespace data_stream {

namespace {

struct MimeEntry {
  const char *extension;
  const char *mime_type;
};

// First entry for a MIME type is its preferred extension.
constexpr MimeEntry kMimeTable[] = {
    {"txt", "text/plain"},
    {"html", "text/html"},
    {"htm", "text/html"},
    {"css", "text/css"},
    {"csv", "text/csv"},
    {"md", "text/markdown"},
    {"json", "application/json"},
    {"xml", "application/xml"},
    {"pdf", "application/pdf"},
    {"zip", "application/zip"},
    {"gz", "application/gzip"},
    {"bin", "application/octet-stream"},
    {"png", "image/png"},
    {"jpeg", "image/jpeg"},
    {"jpg", "image/jpeg"},
    {"gif", "image/gif"},
    {"webp", "image/webp"},
    {"svg", "image/svg+xml"},
    {"mp3", "audio/mpeg"},
    {"wav", "audio/wav"},
    {"ogg", "audio/ogg"},
    {"mp4", "video/mp4"},
    {"mov", "video/quicktime"},
    {"webm", "video/webm"},
};

std::string lowercase(std::string s) {
  std::transform(s.begin(), s.end(), s.begin(),
                 [](unsigned char c) { return std::tolower(c); });
  return s;
}

} // namespace

std::optional<std::string> mime_type_for_extension(const std::string &extension) {
  std::string ext = lowercase(extension);
  if (!ext.empty() && ext.front() == '.') {
    ext.erase(0, 1);
  }
  for (const auto &entry : kMimeTable) {
    if (ext == entry.extension) {
      return std::string(entry.mime_type);
    }
  }
  return std::nullopt;
}

std::optional<std::string> preferred_extension(const std::string &mime_type) {
  const std::string mime = lowercase(mime_type);
  for (const auto &entry : kMimeTable) {
    if (mime == entry.mime_type) {
      return std::string(entry.extension);
    }
  }
  return std::nullopt;
}

std::optional<FileInfo> file_info(const std::string &path) {
  std::error_code ec;
  const fs::path p(path);
  if (!fs::is_regular_file(p, ec) || ec) {
    return std::nullopt;
  }
  const auto size = fs::file_size(p, ec);
  if (ec) {
    return std::nullopt;
  }

  FileInfo info;
  info.name = p.filename().string();
  info.size = static_cast<uint64_t>(size);
  if (p.has_extension()) {
    info.mime_type = mime_type_for_extension(p.extension().string());
  }
  return info;
}

std::string resolve_file_name(const std::optional<std::string> &preferred_name,
                              const std::string &fallback_name,
                              const std::string &mime_type) {
  const auto extension = [&mime_type]() {
    return preferred_extension(mime_type).value_or(kDefaultFileExtension);
  };
  if (!preferred_name) {
    return fallback_name + "." + extension();
  }
  if (!fs::path(*preferred_name).has_extension()) {
    return *preferred_name + "." + extension();
  }
  return *preferred_name;
}

} // namespace data_stream
