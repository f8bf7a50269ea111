#pragma once

#include <atomic>
#include <memory>

namespace transport {

// Shared cancellation flag. Copies observe the same state, so a token can be
// handed to a blocking call and cancelled from another thread.
class CancelToken {
public:
  CancelToken() : flag_(std::make_shared<std::atomic<bool>>(false)) {}

  void cancel() const { flag_->store(true, std::memory_order_release); }
  bool is_cancelled() const { return flag_->load(std::memory_order_acquire); }

private:
  std::shared_ptr<std::atomic<bool>> flag_;
};

} // namespace transport
