#ifndef EXECUTOR_CANCELLATION_HPP
#define EXECUTOR_CANCELLATION_HPP

#include <atomic>
#include <memory>

namespace executor {

// Lets a caller cancel an execution from another thread. Copies share the
// same flag. Cancel is async-signal-safe.
class Canceler {
 public:
  Canceler() : cancelled_(std::make_shared<std::atomic<bool>>(false)) {}

  void Cancel() const { cancelled_->store(true); }
  bool IsCancelled() const { return cancelled_->load(); }

 private:
  std::shared_ptr<std::atomic<bool>> cancelled_;
};

}  // namespace executor

#endif
