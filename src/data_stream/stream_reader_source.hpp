#pragma once

#include <condition_variable>
#include <cstdint>
#include <deque>
#include <exception>
#include <mutex>
#include <optional>
#include <vector>

namespace data_stream {

// Queue bridging the packet dispatcher (producer) and a stream reader
// (consumer). Each chunk is handed out exactly once. Chunks buffered before
// finish() are still delivered; a failure is raised after them, once.
class StreamReaderSource {
public:
  // Ignored after finish.
  void yield(std::vector<uint8_t> chunk);

  void finish();
  void finish(std::exception_ptr error);

  bool is_finished() const;

  // Blocks for the next chunk. nullopt at the end of the stream.
  // Rethrows the failure passed to finish(error).
  std::optional<std::vector<uint8_t>> next();

private:
  mutable std::mutex mutex_;
  std::condition_variable cv_;
  std::deque<std::vector<uint8_t>> chunks_;
  bool finished_ = false;
  std::exception_ptr error_;
};

} // namespace data_stream
