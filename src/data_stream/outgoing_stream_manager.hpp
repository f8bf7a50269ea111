#pragma once

#include <cstddef>
#include <cstdint>
#include <functional>
#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

#include "data_stream.pb.h"
#include "data_stream/stream_info.hpp"
#include "data_stream/stream_options.hpp"

namespace data_stream {

constexpr size_t kDefaultChunkSize = 15000;
constexpr size_t kFileReadChunkSize = 4096;

// Emits one control packet. Throwing aborts the operation that produced it
// and leaves the stream state unchanged.
using PacketHandler = std::function<void(const v1::DataPacket &packet)>;

class ByteStreamWriter;
class TextStreamWriter;

/**
 * @brief Owns the table of open outgoing streams.
 *
 * Each stream is a header packet, zero or more chunk packets with increasing
 * chunk_index, then a trailer packet, all sent through the packet handler.
 * Table mutations and packet emission are serialized by one mutex, so the
 * packet handler must not call back into the manager.
 *
 * Writers only keep a weak reference; once the manager is destroyed their
 * operations throw StreamError(Terminated).
 */
class OutgoingStreamManager
    : public std::enable_shared_from_this<OutgoingStreamManager> {
public:
  static std::shared_ptr<OutgoingStreamManager>
  create(PacketHandler packet_handler, size_t chunk_size = kDefaultChunkSize);

  OutgoingStreamManager(const OutgoingStreamManager &) = delete;
  OutgoingStreamManager &operator=(const OutgoingStreamManager &) = delete;

  ByteStreamWriter stream_bytes(const StreamByteOptions &options);
  TextStreamWriter stream_text(const StreamTextOptions &options);

  // Opens a text stream, writes text and closes it.
  TextStreamInfo send_text(const std::string &text,
                           const StreamTextOptions &options);

  // Opens a byte stream named after the file, copies its contents and closes
  // it. Throws StreamError(FileInfoUnavailable) if path is not a readable
  // regular file.
  ByteStreamInfo send_file(const std::string &path, StreamByteOptions options);

  // Throws StreamError(AlreadyOpened) if the id is already open.
  void open_stream(const ByteStreamInfo &info,
                   const std::vector<std::string> &destinations = {});
  void open_stream(const TextStreamInfo &info,
                   const std::vector<std::string> &destinations = {});

  // Splits data into chunk_size pieces. Throws StreamError(UnknownStream).
  void send(const uint8_t *data, size_t len, const std::string &stream_id);

  // Like send, but never cuts a UTF-8 character in half.
  void send_text_data(const std::string &text, const std::string &stream_id);

  // Emits exactly one chunk packet. Throws StreamError(UnknownStream).
  void send_chunk(const uint8_t *data, size_t len, const std::string &stream_id);

  // Emits the trailer; an empty or missing reason marks a normal end.
  // Throws StreamError(UnknownStream).
  void close_stream(const std::string &stream_id,
                    const std::optional<std::string> &reason = std::nullopt);

  bool has_open_stream(const std::string &stream_id) const;
  size_t open_stream_count() const;

  // Bytes and chunks sent so far on an open stream.
  std::optional<uint64_t> written_length(const std::string &stream_id) const;
  std::optional<uint64_t> next_chunk_index(const std::string &stream_id) const;

  size_t chunk_size() const { return chunk_size_; }

private:
  struct Descriptor {
    std::vector<std::string> destinations;
    uint64_t written_length = 0;
    uint64_t chunk_index = 0;
  };

  OutgoingStreamManager(PacketHandler packet_handler, size_t chunk_size);

  void open_locked(const v1::DataStreamHeader &header,
                   const std::vector<std::string> &destinations);

  PacketHandler packet_handler_;
  size_t chunk_size_;

  mutable std::mutex mutex_;
  std::map<std::string, Descriptor> open_streams_;
};

// Writer handle for an open byte stream.
class ByteStreamWriter {
public:
  ByteStreamWriter(ByteStreamInfo info,
                   std::weak_ptr<OutgoingStreamManager> manager);

  const ByteStreamInfo &info() const { return info_; }

  // false once the stream was closed through any path, or the manager is gone.
  bool is_open() const;

  void write(const std::vector<uint8_t> &data);
  void write(const uint8_t *data, size_t len);

  // Copies a file into the stream in kFileReadChunkSize pieces.
  void write_file(const std::string &path);

  void close(const std::optional<std::string> &reason = std::nullopt);

private:
  std::shared_ptr<OutgoingStreamManager> manager() const;

  ByteStreamInfo info_;
  std::weak_ptr<OutgoingStreamManager> manager_;
};

// Writer handle for an open text stream.
class TextStreamWriter {
public:
  TextStreamWriter(TextStreamInfo info,
                   std::weak_ptr<OutgoingStreamManager> manager);

  const TextStreamInfo &info() const { return info_; }
  bool is_open() const;

  void write(const std::string &text);

  void close(const std::optional<std::string> &reason = std::nullopt);

private:
  std::shared_ptr<OutgoingStreamManager> manager() const;

  TextStreamInfo info_;
  std::weak_ptr<OutgoingStreamManager> manager_;
};

// Random version 4 UUID, upper case.
std::string make_stream_id();

} // namespace data_stream
