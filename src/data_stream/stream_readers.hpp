#pragma once

#include <cstdint>
#include <memory>
#include <optional>
#include <string>
#include <vector>

#include "data_stream/stream_info.hpp"
#include "data_stream/stream_reader_source.hpp"

namespace data_stream {

/**
 * @brief Consumer side of an incoming byte stream.
 *
 * Copies share one source, so each chunk reaches only one of them.
 * Failures (AbnormalEnd, Incomplete, LengthExceeded, Terminated) are thrown
 * as StreamError from next() and read_all().
 */
class ByteStreamReader {
public:
  ByteStreamReader(ByteStreamInfo info,
                   std::shared_ptr<StreamReaderSource> source);

  const ByteStreamInfo &info() const { return info_; }

  // Blocks for the next chunk; nullopt at the end.
  std::optional<std::vector<uint8_t>> next();

  // Drains the stream into one buffer.
  std::vector<uint8_t> read_all();

  // Streams the remaining chunks into directory/<resolved name> and returns
  // the file path. Throws StreamError(NotDirectory) if directory does not
  // exist, std::runtime_error on I/O failure.
  std::string write_to_file(const std::string &directory,
                            const std::optional<std::string> &name_override =
                                std::nullopt);

private:
  ByteStreamInfo info_;
  std::shared_ptr<StreamReaderSource> source_;
};

// Consumer side of an incoming text stream. Characters split across chunk
// boundaries are reassembled before decoding; bytes that never form valid
// UTF-8 raise StreamError(DecodeFailed).
class TextStreamReader {
public:
  TextStreamReader(TextStreamInfo info,
                   std::shared_ptr<StreamReaderSource> source);

  const TextStreamInfo &info() const { return info_; }

  // Next decoded piece of text; nullopt at the end. Not thread-safe.
  std::optional<std::string> next();

  std::string read_all();

private:
  TextStreamInfo info_;
  std::shared_ptr<StreamReaderSource> source_;
  std::vector<uint8_t> pending_; // start of a character cut by a chunk boundary
};

} // namespace data_stream
