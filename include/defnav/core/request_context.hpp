#pragma once

#include <atomic>
#include <memory>
#include <string>
#include <utility>

namespace defnav {

// Ambient state of one incoming request. Copies share the cancellation flag,
// so whoever holds a copy can cancel the request for everyone.
class RequestContext {
 public:
  explicit RequestContext(std::string method)
      : method_(std::move(method)),
        cancelled_(std::make_shared<std::atomic<bool>>(false)) {
  }

  [[nodiscard]] auto Method() const -> const std::string& {
    return method_;
  }

  [[nodiscard]] auto IsCancelled() const -> bool {
    return cancelled_->load(std::memory_order_acquire);
  }

  void Cancel() const {
    cancelled_->store(true, std::memory_order_release);
  }

 private:
  std::string method_;
  std::shared_ptr<std::atomic<bool>> cancelled_;
};

}  // namespace defnav
