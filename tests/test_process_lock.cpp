#include "process_lock.hpp"
#include <atomic>
#include <cassert>
#include <thread>
#include <utility>
#include <vector>

static void exclusive_on_own_flag() {
  std::atomic<bool> flag{false};
  auto a = ProcessLock::acquire(flag);
  assert(a && a->held());
  assert(flag.load());
  auto b = ProcessLock::acquire(flag);
  assert(!b);
  a.reset();
  assert(!flag.load());
  auto c = ProcessLock::acquire(flag);
  assert(c);
}

static void move_transfers_ownership() {
  std::atomic<bool> flag{false};
  auto a = ProcessLock::acquire(flag);
  assert(a);
  ProcessLock moved = std::move(*a);
  assert(moved.held());
  assert(!a->held());
  a.reset();
  // the moved-from token must not clear the flag
  assert(flag.load());
  {
    ProcessLock sink = std::move(moved);
    assert(sink.held());
  }
  assert(!flag.load());
}

static void one_winner_under_race() {
  std::atomic<bool> flag{false};
  std::atomic<int> winners{0};
  std::atomic<bool> go{false};
  std::vector<std::optional<ProcessLock>> held(8);
  std::vector<std::thread> threads;
  for (int i = 0; i < 8; ++i) {
    threads.emplace_back([&, i] {
      while (!go.load()) std::this_thread::yield();
      held[i] = ProcessLock::acquire(flag);
      if (held[i]) winners++;
    });
  }
  go = true;
  for (auto& t : threads) t.join();
  assert(winners.load() == 1);
  held.clear();
  assert(!flag.load());
}

static void process_flag_is_shared() {
  auto a = ProcessLock::acquire();
  assert(a);
  assert(!ProcessLock::acquire());
  a.reset();
  auto b = ProcessLock::acquire();
  assert(b);
}

int main() {
  exclusive_on_own_flag();
  move_transfers_ownership();
  one_winner_under_race();
  process_flag_is_shared();
  return 0;
}
