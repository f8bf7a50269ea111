#include "data_stream/stream_reader_source.hpp"

#include <utility>

namespace data_stream {

void StreamReaderSource::yield(std::vector<uint8_t> chunk) {
  {
    std::lock_guard<std::mutex> lock(mutex_);
    if (finished_) {
      return;
    }
    chunks_.push_back(std::move(chunk));
  }
  cv_.notify_one();
}

void StreamReaderSource::finish() { finish(nullptr); }

void StreamReaderSource::finish(std::exception_ptr error) {
  {
    std::lock_guard<std::mutex> lock(mutex_);
    if (finished_) {
      return;
    }
    finished_ = true;
    error_ = std::move(error);
  }
  cv_.notify_all();
}

bool StreamReaderSource::is_finished() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return finished_;
}

std::optional<std::vector<uint8_t>> StreamReaderSource::next() {
  std::unique_lock<std::mutex> lock(mutex_);
  cv_.wait(lock, [this]() { return finished_ || !chunks_.empty(); });

  if (!chunks_.empty()) {
    std::vector<uint8_t> chunk = std::move(chunks_.front());
    chunks_.pop_front();
    return chunk;
  }
  if (error_) {
    std::exception_ptr error = std::exchange(error_, nullptr);
    std::rethrow_exception(error);
  }
  return std::nullopt;
}

} // namespace data_stream
