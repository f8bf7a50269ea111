#include "data_stream/stream_readers.hpp"

#include <filesystem>
#include <fstream>
#include <stdexcept>
#include <system_error>

#include "data_stream/file_info.hpp"
#include "data_stream/stream_error.hpp"
#include "data_stream/utf8.hpp"

namespace fs = std::filesystem;

namespace data_stream {

// -----------------------------
// ByteStreamReader
// -----------------------------

ByteStreamReader::ByteStreamReader(ByteStreamInfo info,
                                   std::shared_ptr<StreamReaderSource> source)
    : info_(std::move(info)), source_(std::move(source)) {}

std::optional<std::vector<uint8_t>> ByteStreamReader::next() {
  return source_->next();
}

std::vector<uint8_t> ByteStreamReader::read_all() {
  std::vector<uint8_t> out;
  while (auto chunk = next()) {
    out.insert(out.end(), chunk->begin(), chunk->end());
  }
  return out;
}

std::string
ByteStreamReader::write_to_file(const std::string &directory,
                                const std::optional<std::string> &name_override) {
  std::error_code ec;
  if (!fs::is_directory(directory, ec)) {
    throw StreamError(StreamError::Code::NotDirectory, directory);
  }

  const std::string file_name = resolve_file_name(
      name_override ? name_override : info_.name, info_.id, info_.mime_type);
  // Names come from the remote peer; never let them leave the directory.
  const fs::path leaf = fs::path(file_name).filename();
  if (leaf.empty() || leaf == "." || leaf == "..") {
    throw std::runtime_error("invalid file name '" + file_name + "'");
  }
  const fs::path path = fs::path(directory) / leaf;

  std::ofstream out(path, std::ios::binary | std::ios::trunc);
  if (!out) {
    throw std::runtime_error("failed to open " + path.string() +
                             " for writing");
  }
  while (auto chunk = next()) {
    out.write(reinterpret_cast<const char *>(chunk->data()),
              static_cast<std::streamsize>(chunk->size()));
    if (!out) {
      throw std::runtime_error("failed to write " + path.string());
    }
  }
  out.close();
  if (!out) {
    throw std::runtime_error("failed to close " + path.string());
  }
  return path.string();
}

// -----------------------------
// TextStreamReader
// -----------------------------

TextStreamReader::TextStreamReader(TextStreamInfo info,
                                   std::shared_ptr<StreamReaderSource> source)
    : info_(std::move(info)), source_(std::move(source)) {}

std::optional<std::string> TextStreamReader::next() {
  for (;;) {
    auto chunk = source_->next();
    if (!chunk) {
      if (!pending_.empty()) {
        pending_.clear();
        throw StreamError(StreamError::Code::DecodeFailed);
      }
      return std::nullopt;
    }

    pending_.insert(pending_.end(), chunk->begin(), chunk->end());
    const size_t carry =
        utf8::incomplete_suffix_length(pending_.data(), pending_.size());
    const size_t complete = pending_.size() - carry;

    if (!utf8::is_valid(pending_.data(), complete)) {
      pending_.clear();
      throw StreamError(StreamError::Code::DecodeFailed);
    }

    std::string text(reinterpret_cast<const char *>(pending_.data()), complete);
    pending_.erase(pending_.begin(),
                   pending_.begin() + static_cast<std::ptrdiff_t>(complete));
    if (!text.empty()) {
      return text;
    }
  }
}

std::string TextStreamReader::read_all() {
  std::string out;
  while (auto text = next()) {
    out += *text;
  }
  return out;
}

} // namespace data_stream
