#include "data_stream/incoming_stream_manager.hpp"

#include <exception>
#include <memory>
#include <thread>
#include <vector>

#include "data_stream/stream_error.hpp"
#include "logging.hpp"

namespace data_stream {

namespace logging = ::broadcast_ipc::logging;

namespace {

std::exception_ptr stream_error(StreamError::Code code,
                                const std::string &reason = {}) {
  return std::make_exception_ptr(StreamError(code, reason));
}

// Handler failures belong to the handler's stream; log and move on.
std::function<void()> guarded(std::function<void()> body,
                              const std::string &stream_id) {
  return [body = std::move(body), stream_id]() {
    try {
      body();
    } catch (const std::exception &e) {
      logging::warn("handler for stream '" + stream_id + "' failed: " +
                    e.what());
    }
  };
}

} // namespace

Executor detached_thread_executor() {
  return [](std::function<void()> task) {
    std::thread(std::move(task)).detach();
  };
}

Executor inline_executor() {
  return [](std::function<void()> task) { task(); };
}

IncomingStreamManager::IncomingStreamManager(Executor executor)
    : executor_(std::move(executor)) {}

IncomingStreamManager::~IncomingStreamManager() {
  terminate_open_streams();
  wait_for_handlers();
}

void IncomingStreamManager::terminate_open_streams() {
  std::lock_guard<std::mutex> lock(mutex_);
  for (auto &[id, descriptor] : open_streams_) {
    if (auto source = descriptor.source.lock()) {
      source->finish(stream_error(StreamError::Code::Terminated));
    }
  }
  open_streams_.clear();
}

void IncomingStreamManager::wait_for_handlers() { handlers_->wait_idle(); }

// -----------------------------
// HandlerTracker
// -----------------------------

void IncomingStreamManager::HandlerTracker::begin() {
  std::lock_guard<std::mutex> lock(mutex_);
  ++running_;
}

void IncomingStreamManager::HandlerTracker::end() {
  std::lock_guard<std::mutex> lock(mutex_);
  if (--running_ == 0) {
    idle_.notify_all();
  }
}

void IncomingStreamManager::HandlerTracker::wait_idle() {
  std::unique_lock<std::mutex> lock(mutex_);
  idle_.wait(lock, [this]() { return running_ == 0; });
}

// -----------------------------
// Handler registration
// -----------------------------

void IncomingStreamManager::register_byte_stream_handler(
    const std::string &topic, ByteStreamHandler handler) {
  std::lock_guard<std::mutex> lock(mutex_);
  if (byte_handlers_.count(topic) != 0) {
    throw StreamError(StreamError::Code::HandlerAlreadyRegistered);
  }
  byte_handlers_.emplace(topic, std::move(handler));
}

void IncomingStreamManager::register_text_stream_handler(
    const std::string &topic, TextStreamHandler handler) {
  std::lock_guard<std::mutex> lock(mutex_);
  if (text_handlers_.count(topic) != 0) {
    throw StreamError(StreamError::Code::HandlerAlreadyRegistered);
  }
  text_handlers_.emplace(topic, std::move(handler));
}

void IncomingStreamManager::unregister_byte_stream_handler(
    const std::string &topic) {
  std::lock_guard<std::mutex> lock(mutex_);
  byte_handlers_.erase(topic);
}

void IncomingStreamManager::unregister_text_stream_handler(
    const std::string &topic) {
  std::lock_guard<std::mutex> lock(mutex_);
  text_handlers_.erase(topic);
}

// -----------------------------
// Packet handling
// -----------------------------

void IncomingStreamManager::handle_packet(const v1::DataPacket &packet) {
  switch (packet.value_case()) {
  case v1::DataPacket::kStreamHeader:
    handle_header(packet.stream_header(), packet.participant_identity());
    break;
  case v1::DataPacket::kStreamChunk:
    handle_chunk(packet.stream_chunk());
    break;
  case v1::DataPacket::kStreamTrailer:
    handle_trailer(packet.stream_trailer());
    break;
  case v1::DataPacket::VALUE_NOT_SET:
    logging::debug("ignoring empty data packet");
    break;
  }
}

void IncomingStreamManager::handle_header(const v1::DataStreamHeader &header,
                                          const std::string &from_identity) {
  const std::string &id = header.stream_id();
  std::function<void()> task;

  {
    std::lock_guard<std::mutex> lock(mutex_);
    auto open = open_streams_.find(id);
    if (open != open_streams_.end()) {
      if (!open->second.source.expired()) {
        throw StreamError(StreamError::Code::AlreadyOpened);
      }
      open_streams_.erase(open);
    }

    auto source = std::make_shared<StreamReaderSource>();

    switch (header.content_header_case()) {
    case v1::DataStreamHeader::kByteHeader: {
      auto it = byte_handlers_.find(header.topic());
      if (it != byte_handlers_.end()) {
        ByteStreamReader reader(byte_info_from_header(header), source);
        task = [handler = it->second, reader, from_identity]() {
          handler(reader, from_identity);
        };
      }
      break;
    }
    case v1::DataStreamHeader::kTextHeader: {
      auto it = text_handlers_.find(header.topic());
      if (it != text_handlers_.end()) {
        TextStreamReader reader(text_info_from_header(header), source);
        task = [handler = it->second, reader, from_identity]() {
          handler(reader, from_identity);
        };
      }
      break;
    }
    case v1::DataStreamHeader::CONTENT_HEADER_NOT_SET:
      logging::debug("dropping stream '" + id + "' without content header");
      return;
    }

    if (!task) {
      if (unhandled_topics_.insert(header.topic()).second) {
        logging::warn("no handler for incoming stream '" + id +
                      "' on topic '" + header.topic() + "' from '" +
                      from_identity + "'");
      }
      return;
    }

    Descriptor descriptor;
    descriptor.topic = header.topic();
    descriptor.source = source;
    if (header.has_total_length()) {
      descriptor.total_length = header.total_length();
    }
    open_streams_.emplace(id, std::move(descriptor));
  }

  logging::debug("opened incoming stream '" + id + "' on topic '" +
                 header.topic() + "'");
  std::shared_ptr<HandlerTracker> handlers = handlers_;
  handlers->begin();
  try {
    executor_([handlers, body = guarded(std::move(task), id)]() {
      struct Done {
        std::shared_ptr<HandlerTracker> tracker;
        ~Done() { tracker->end(); }
      } done{handlers};
      body();
    });
  } catch (const std::exception &e) {
    handlers->end();
    logging::error("failed to dispatch handler for stream '" + id +
                   "': " + e.what());
    throw;
  }
}

void IncomingStreamManager::handle_chunk(const v1::DataStreamChunk &chunk) {
  if (chunk.content().empty()) {
    return;
  }

  std::lock_guard<std::mutex> lock(mutex_);
  auto it = open_streams_.find(chunk.stream_id());
  if (it == open_streams_.end()) {
    return;
  }
  Descriptor &descriptor = it->second;

  auto source = descriptor.source.lock();
  if (!source) {
    logging::debug("no reader left for stream '" + chunk.stream_id() +
                   "', dropping it");
    open_streams_.erase(it);
    return;
  }

  if (chunk.chunk_index() != descriptor.next_chunk_index) {
    logging::warn("stream '" + chunk.stream_id() + "' expected chunk " +
                  std::to_string(descriptor.next_chunk_index) + ", got " +
                  std::to_string(chunk.chunk_index()));
  }
  descriptor.next_chunk_index = chunk.chunk_index() + 1;

  const uint64_t read_length = descriptor.read_length + chunk.content().size();
  if (descriptor.total_length && read_length > *descriptor.total_length) {
    source->finish(stream_error(StreamError::Code::LengthExceeded));
    open_streams_.erase(it);
    return;
  }
  descriptor.read_length = read_length;

  const std::string &content = chunk.content();
  source->yield(std::vector<uint8_t>(content.begin(), content.end()));
}

void IncomingStreamManager::handle_trailer(const v1::DataStreamTrailer &trailer) {
  std::lock_guard<std::mutex> lock(mutex_);
  auto it = open_streams_.find(trailer.stream_id());
  if (it == open_streams_.end()) {
    return;
  }
  Descriptor &descriptor = it->second;
  auto source = descriptor.source.lock();

  if (source) {
    if (descriptor.total_length &&
        descriptor.read_length != *descriptor.total_length) {
      source->finish(stream_error(StreamError::Code::Incomplete));
    } else if (!trailer.reason().empty()) {
      source->finish(
          stream_error(StreamError::Code::AbnormalEnd, trailer.reason()));
    } else {
      source->finish();
    }
  }

  logging::debug("closed incoming stream '" + trailer.stream_id() + "'");
  open_streams_.erase(it);
}

bool IncomingStreamManager::has_open_stream(const std::string &stream_id) const {
  std::lock_guard<std::mutex> lock(mutex_);
  auto it = open_streams_.find(stream_id);
  return it != open_streams_.end() && !it->second.source.expired();
}

size_t IncomingStreamManager::open_stream_count() const {
  std::lock_guard<std::mutex> lock(mutex_);
  size_t count = 0;
  for (const auto &entry : open_streams_) {
    if (!entry.second.source.expired()) {
      ++count;
    }
  }
  return count;
}

} // namespace data_stream
