#pragma once
/*
 * ProcessLock
 *
 * Purpose: held token proving exclusive use of the terminal driver.
 * Rule: acquire() is a single atomic exchange; it never blocks or retries.
 *       Destroying the held token resets the flag. Move-only.
 */
#include <atomic>
#include <optional>

class ProcessLock {
public:
  // the process-wide flag shared by every Session
  static std::optional<ProcessLock> acquire();
  // explicit flag, for callers that need their own exclusivity domain
  static std::optional<ProcessLock> acquire(std::atomic<bool>& flag);

  ProcessLock(const ProcessLock&) = delete;
  ProcessLock& operator=(const ProcessLock&) = delete;
  ProcessLock(ProcessLock&& other) noexcept : flag_(other.flag_) { other.flag_ = nullptr; }
  ProcessLock& operator=(ProcessLock&& other) noexcept {
    if (this != &other) { release(); flag_ = other.flag_; other.flag_ = nullptr; }
    return *this;
  }
  ~ProcessLock() { release(); }

  bool held() const { return flag_ != nullptr; }

private:
  explicit ProcessLock(std::atomic<bool>* flag) : flag_(flag) {}
  void release() noexcept {
    if (flag_) { flag_->store(false, std::memory_order_release); flag_ = nullptr; }
  }
  std::atomic<bool>* flag_;
};
