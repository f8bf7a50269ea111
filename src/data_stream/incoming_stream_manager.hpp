#pragma once

#include <condition_variable>
#include <cstdint>
#include <functional>
#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <set>
#include <string>

#include "data_stream.pb.h"
#include "data_stream/stream_readers.hpp"

namespace data_stream {

using ByteStreamHandler =
    std::function<void(ByteStreamReader reader, const std::string &from_identity)>;
using TextStreamHandler =
    std::function<void(TextStreamReader reader, const std::string &from_identity)>;

// Runs a stream handler. Handlers may block on their reader, so an executor
// that runs them on the dispatching thread must only be used with handlers
// that return without reading.
using Executor = std::function<void(std::function<void()> task)>;

// One detached thread per incoming stream.
Executor detached_thread_executor();

// Runs the handler on the calling thread.
Executor inline_executor();

/**
 * @brief Reassembles incoming streams and routes them to topic handlers.
 *
 * handle_header() opens a stream when a handler is registered for its topic
 * and content kind, and invokes that handler once with a fresh reader.
 * Chunks are appended in arrival order; the trailer finishes the reader,
 * with Incomplete taking precedence over an AbnormalEnd reason.
 *
 * Chunks and trailers for unknown streams are dropped. A stream whose
 * readers have all been destroyed is dropped together with its buffered
 * chunks when its next packet arrives. All methods are thread-safe; handlers
 * run outside the internal lock.
 */
class IncomingStreamManager {
public:
  explicit IncomingStreamManager(Executor executor = detached_thread_executor());

  // Fails every still-open reader with StreamError(Terminated), then waits
  // for running handlers to return.
  ~IncomingStreamManager();

  IncomingStreamManager(const IncomingStreamManager &) = delete;
  IncomingStreamManager &operator=(const IncomingStreamManager &) = delete;

  // Throws StreamError(HandlerAlreadyRegistered) if the topic already has a
  // handler of the same kind.
  void register_byte_stream_handler(const std::string &topic,
                                    ByteStreamHandler handler);
  void register_text_stream_handler(const std::string &topic,
                                    TextStreamHandler handler);

  // No-op if nothing is registered.
  void unregister_byte_stream_handler(const std::string &topic);
  void unregister_text_stream_handler(const std::string &topic);

  // Dispatches on the packet's value.
  void handle_packet(const v1::DataPacket &packet);

  // Throws StreamError(AlreadyOpened) if the stream id is still open; the
  // open stream is left untouched.
  void handle_header(const v1::DataStreamHeader &header,
                     const std::string &from_identity);
  void handle_chunk(const v1::DataStreamChunk &chunk);
  void handle_trailer(const v1::DataStreamTrailer &trailer);

  // Fails every still-open reader with StreamError(Terminated). Used when no
  // more packets can arrive.
  void terminate_open_streams();

  // Blocks until every dispatched handler has returned.
  void wait_for_handlers();

  // Streams with at least one live reader.
  bool has_open_stream(const std::string &stream_id) const;
  size_t open_stream_count() const;

private:
  // Handlers dispatched but not yet returned. Shared with the handler tasks
  // so a task never touches a destroyed manager.
  class HandlerTracker {
  public:
    void begin();
    void end();
    void wait_idle();

  private:
    std::mutex mutex_;
    std::condition_variable idle_;
    size_t running_ = 0;
  };

  struct Descriptor {
    std::string topic;
    std::weak_ptr<StreamReaderSource> source; // owned by the readers
    std::optional<uint64_t> total_length;
    uint64_t read_length = 0;
    uint64_t next_chunk_index = 0;
  };

  Executor executor_;
  std::shared_ptr<HandlerTracker> handlers_ = std::make_shared<HandlerTracker>();

  mutable std::mutex mutex_;
  std::map<std::string, Descriptor> open_streams_;
  std::map<std::string, ByteStreamHandler> byte_handlers_;
  std::map<std::string, TextStreamHandler> text_handlers_;
  std::set<std::string> unhandled_topics_; // warned once each
};

} // namespace data_stream
