#ifndef DATASTORE_UTIL_WAITER_HPP
#define DATASTORE_UTIL_WAITER_HPP

#include <chrono>
#include <condition_variable>
#include <mutex>

namespace datastore::util {

// Bounded sleep that a shutdown request can cut short.
class Waiter {
public:
  Waiter() = default;
  Waiter(const Waiter&) = delete;
  Waiter& operator=(const Waiter&) = delete;

  // Blocks for up to `duration`. Returns false if the waiter was stopped.
  template <typename Rep, typename Period>
  bool wait_for(const std::chrono::duration<Rep, Period>& duration) {
    std::unique_lock<std::mutex> lock(mutex_);
    return !cv_.wait_for(lock, duration, [this] { return stopped_; });
  }

  // Wakes every current and future waiter
  void stop() {
    {
      std::lock_guard<std::mutex> lock(mutex_);
      stopped_ = true;
    }
    cv_.notify_all();
  }

  bool stopped() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return stopped_;
  }

private:
  mutable std::mutex mutex_;
  std::condition_variable cv_;
  bool stopped_ = false;
};

} // namespace datastore::util

#endif // DATASTORE_UTIL_WAITER_HPP
