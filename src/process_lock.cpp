#include "process_lock.hpp"

static std::atomic<bool>& session_flag() {
  static std::atomic<bool> flag{false};
  return flag;
}

std::optional<ProcessLock> ProcessLock::acquire() {
  return acquire(session_flag());
}

std::optional<ProcessLock> ProcessLock::acquire(std::atomic<bool>& flag) {
  if (flag.exchange(true, std::memory_order_acquire)) return std::nullopt;
  return ProcessLock(&flag);
}
