#pragma once

#include <atomic>
#include <memory>

namespace blockflow {

// Copies share one flag; Cancel() may be called from any thread.
class CancellationToken {
  public:
    CancellationToken() : flag_(std::make_shared<std::atomic<bool>>(false)) {}

    void Cancel() const { flag_->store(true, std::memory_order_release); }
    bool IsCancelled() const { return flag_->load(std::memory_order_acquire); }

  private:
    std::shared_ptr<std::atomic<bool>> flag_;
};

} // namespace blockflow
