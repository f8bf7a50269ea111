#include "data_stream/outgoing_stream_manager.hpp"

#include <algorithm>
#include <cctype>
#include <chrono>
#include <fstream>
#include <stdexcept>

#include <boost/uuid/random_generator.hpp>
#include <boost/uuid/uuid.hpp>
#include <boost/uuid/uuid_io.hpp>

#include "data_stream/file_info.hpp"
#include "data_stream/stream_error.hpp"
#include "data_stream/utf8.hpp"
#include "logging.hpp"

namespace data_stream {

namespace logging = ::broadcast_ipc::logging;

std::string make_stream_id() {
  thread_local boost::uuids::random_generator generate;
  std::string id = boost::uuids::to_string(generate());
  std::transform(id.begin(), id.end(), id.begin(),
                 [](unsigned char c) { return std::toupper(c); });
  return id;
}

// -----------------------------
// OutgoingStreamManager
// -----------------------------

std::shared_ptr<OutgoingStreamManager>
OutgoingStreamManager::create(PacketHandler packet_handler, size_t chunk_size) {
  return std::shared_ptr<OutgoingStreamManager>(
      new OutgoingStreamManager(std::move(packet_handler), chunk_size));
}

OutgoingStreamManager::OutgoingStreamManager(PacketHandler packet_handler,
                                             size_t chunk_size)
    : packet_handler_(std::move(packet_handler)),
      chunk_size_(chunk_size > 0 ? chunk_size : kDefaultChunkSize) {}

void OutgoingStreamManager::open_locked(
    const v1::DataStreamHeader &header,
    const std::vector<std::string> &destinations) {
  if (open_streams_.count(header.stream_id()) != 0) {
    throw StreamError(StreamError::Code::AlreadyOpened);
  }

  v1::DataPacket packet;
  for (const auto &identity : destinations) {
    packet.add_destination_identities(identity);
  }
  *packet.mutable_stream_header() = header;
  packet_handler_(packet);

  Descriptor descriptor;
  descriptor.destinations = destinations;
  open_streams_.emplace(header.stream_id(), std::move(descriptor));

  logging::debug("opened stream '" + header.stream_id() + "' on topic '" +
                 header.topic() + "'");
}

void OutgoingStreamManager::open_stream(
    const ByteStreamInfo &info, const std::vector<std::string> &destinations) {
  std::lock_guard<std::mutex> lock(mutex_);
  open_locked(to_header(info), destinations);
}

void OutgoingStreamManager::open_stream(
    const TextStreamInfo &info, const std::vector<std::string> &destinations) {
  std::lock_guard<std::mutex> lock(mutex_);
  open_locked(to_header(info), destinations);
}

void OutgoingStreamManager::send(const uint8_t *data, size_t len,
                                 const std::string &stream_id) {
  for (size_t offset = 0; offset < len; offset += chunk_size_) {
    send_chunk(data + offset, std::min(chunk_size_, len - offset), stream_id);
  }
}

void OutgoingStreamManager::send_text_data(const std::string &text,
                                           const std::string &stream_id) {
  const auto *bytes = reinterpret_cast<const uint8_t *>(text.data());
  size_t offset = 0;
  while (offset < text.size()) {
    const size_t end = utf8::split_point(text, offset, chunk_size_);
    send_chunk(bytes + offset, end - offset, stream_id);
    offset = end;
  }
}

void OutgoingStreamManager::send_chunk(const uint8_t *data, size_t len,
                                       const std::string &stream_id) {
  std::lock_guard<std::mutex> lock(mutex_);
  auto it = open_streams_.find(stream_id);
  if (it == open_streams_.end()) {
    throw StreamError(StreamError::Code::UnknownStream);
  }
  Descriptor &descriptor = it->second;

  v1::DataPacket packet;
  for (const auto &identity : descriptor.destinations) {
    packet.add_destination_identities(identity);
  }
  auto *chunk = packet.mutable_stream_chunk();
  chunk->set_stream_id(stream_id);
  chunk->set_chunk_index(descriptor.chunk_index);
  chunk->set_content(reinterpret_cast<const char *>(data), len);
  packet_handler_(packet);

  // Counters only move once the chunk has been handed off.
  descriptor.written_length += len;
  descriptor.chunk_index += 1;
}

void OutgoingStreamManager::close_stream(
    const std::string &stream_id, const std::optional<std::string> &reason) {
  std::lock_guard<std::mutex> lock(mutex_);
  auto it = open_streams_.find(stream_id);
  if (it == open_streams_.end()) {
    throw StreamError(StreamError::Code::UnknownStream);
  }

  v1::DataPacket packet;
  for (const auto &identity : it->second.destinations) {
    packet.add_destination_identities(identity);
  }
  auto *trailer = packet.mutable_stream_trailer();
  trailer->set_stream_id(stream_id);
  trailer->set_reason(reason.value_or(""));
  packet_handler_(packet);

  open_streams_.erase(it);
  logging::debug("closed stream '" + stream_id + "'");
}

bool OutgoingStreamManager::has_open_stream(const std::string &stream_id) const {
  std::lock_guard<std::mutex> lock(mutex_);
  return open_streams_.count(stream_id) != 0;
}

size_t OutgoingStreamManager::open_stream_count() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return open_streams_.size();
}

std::optional<uint64_t>
OutgoingStreamManager::written_length(const std::string &stream_id) const {
  std::lock_guard<std::mutex> lock(mutex_);
  auto it = open_streams_.find(stream_id);
  if (it == open_streams_.end()) {
    return std::nullopt;
  }
  return it->second.written_length;
}

std::optional<uint64_t>
OutgoingStreamManager::next_chunk_index(const std::string &stream_id) const {
  std::lock_guard<std::mutex> lock(mutex_);
  auto it = open_streams_.find(stream_id);
  if (it == open_streams_.end()) {
    return std::nullopt;
  }
  return it->second.chunk_index;
}

ByteStreamWriter
OutgoingStreamManager::stream_bytes(const StreamByteOptions &options) {
  ByteStreamInfo info;
  info.id = options.id.value_or(make_stream_id());
  info.mime_type = options.mime_type.value_or(kByteMimeType);
  info.topic = options.topic;
  info.timestamp = std::chrono::system_clock::now();
  info.total_length = options.total_size;
  info.attributes = options.attributes;
  info.name = options.name;

  open_stream(info, options.destination_identities);
  return ByteStreamWriter(std::move(info), weak_from_this());
}

TextStreamWriter
OutgoingStreamManager::stream_text(const StreamTextOptions &options) {
  TextStreamInfo info;
  info.id = options.id.value_or(make_stream_id());
  info.mime_type = kTextMimeType;
  info.topic = options.topic;
  info.timestamp = std::chrono::system_clock::now();
  info.attributes = options.attributes;
  info.operation_type = OperationType::Create;
  info.version = options.version;
  info.reply_to_stream_id = options.reply_to_stream_id;
  info.attached_stream_ids = options.attached_stream_ids;

  open_stream(info, options.destination_identities);
  return TextStreamWriter(std::move(info), weak_from_this());
}

TextStreamInfo OutgoingStreamManager::send_text(const std::string &text,
                                                const StreamTextOptions &options) {
  TextStreamWriter writer = stream_text(options);
  writer.write(text);
  writer.close();
  return writer.info();
}

ByteStreamInfo OutgoingStreamManager::send_file(const std::string &path,
                                                StreamByteOptions options) {
  auto file = file_info(path);
  if (!file) {
    throw StreamError(StreamError::Code::FileInfoUnavailable, path);
  }
  if (!options.name) {
    options.name = file->name;
  }
  if (!options.mime_type) {
    options.mime_type = file->mime_type.value_or(kByteMimeType);
  }
  if (!options.total_size) {
    options.total_size = file->size;
  }

  ByteStreamWriter writer = stream_bytes(options);
  try {
    writer.write_file(path);
  } catch (const std::exception &e) {
    // Tell the peer the stream will not complete, then rethrow the write
    // error.
    if (has_open_stream(writer.info().id)) {
      try {
        close_stream(writer.info().id, std::string("send failed: ") + e.what());
      } catch (const std::exception &close_error) {
        logging::warn("failed to abort stream '" + writer.info().id +
                      "': " + close_error.what());
      }
    }
    throw;
  }
  writer.close();
  return writer.info();
}

// -----------------------------
// Writers
// -----------------------------

ByteStreamWriter::ByteStreamWriter(ByteStreamInfo info,
                                   std::weak_ptr<OutgoingStreamManager> manager)
    : info_(std::move(info)), manager_(std::move(manager)) {}

std::shared_ptr<OutgoingStreamManager> ByteStreamWriter::manager() const {
  auto manager = manager_.lock();
  if (!manager) {
    throw StreamError(StreamError::Code::Terminated);
  }
  return manager;
}

bool ByteStreamWriter::is_open() const {
  auto manager = manager_.lock();
  return manager && manager->has_open_stream(info_.id);
}

void ByteStreamWriter::write(const std::vector<uint8_t> &data) {
  write(data.data(), data.size());
}

void ByteStreamWriter::write(const uint8_t *data, size_t len) {
  manager()->send(data, len, info_.id);
}

void ByteStreamWriter::write_file(const std::string &path) {
  std::ifstream in(path, std::ios::binary);
  if (!in) {
    throw StreamError(StreamError::Code::FileInfoUnavailable, path);
  }
  std::vector<uint8_t> buf(kFileReadChunkSize);
  while (in) {
    in.read(reinterpret_cast<char *>(buf.data()),
            static_cast<std::streamsize>(buf.size()));
    const auto n = static_cast<size_t>(in.gcount());
    if (n > 0) {
      write(buf.data(), n);
    }
  }
  if (in.bad()) {
    throw std::runtime_error("failed to read " + path);
  }
}

void ByteStreamWriter::close(const std::optional<std::string> &reason) {
  manager()->close_stream(info_.id, reason);
}

TextStreamWriter::TextStreamWriter(TextStreamInfo info,
                                   std::weak_ptr<OutgoingStreamManager> manager)
    : info_(std::move(info)), manager_(std::move(manager)) {}

std::shared_ptr<OutgoingStreamManager> TextStreamWriter::manager() const {
  auto manager = manager_.lock();
  if (!manager) {
    throw StreamError(StreamError::Code::Terminated);
  }
  return manager;
}

bool TextStreamWriter::is_open() const {
  auto manager = manager_.lock();
  return manager && manager->has_open_stream(info_.id);
}

void TextStreamWriter::write(const std::string &text) {
  manager()->send_text_data(text, info_.id);
}

void TextStreamWriter::close(const std::optional<std::string> &reason) {
  manager()->close_stream(info_.id, reason);
}

} // namespace data_stream
