#include "internal/lock/mutation_lock.hpp"

#include <algorithm>
#include <atomic>
#include <cassert>
#include <chrono>
#include <iostream>
#include <thread>
#include <vector>

#include "internal/util/errors.hpp"

namespace {

using backoffice::lock::MutationLock;
using namespace std::chrono_literals;

void TestReentrantAcquireIsRejected() {
  MutationLock lock(100ms);
  auto         guard = lock.Acquire("outer");
  assert(lock.HeldByCurrentThread());

  bool threw = false;
  try {
    (void)lock.Acquire("inner");
  } catch (const backoffice::util::InvalidState&) {
    threw = true;
  }
  assert(threw);
  assert(guard.Active());
}

void TestBoundedWaitReportsBusy() {
  MutationLock      lock(50ms);
  std::atomic<bool> held{false};
  std::atomic<bool> done{false};

  std::thread holder([&] {
    auto guard = lock.Acquire("holder");
    held       = true;
    while (!done) std::this_thread::sleep_for(1ms);
  });
  while (!held) std::this_thread::sleep_for(1ms);

  bool busy = false;
  try {
    (void)lock.Acquire("waiter");
  } catch (const backoffice::util::Busy&) {
    busy = true;
  }
  assert(busy);
  assert(!lock.HeldByCurrentThread());

  done = true;
  holder.join();

  auto guard = lock.Acquire("after");
  assert(guard.Active());
}

void TestReleaseIsIdempotentAndEpochsAdvance() {
  MutationLock lock(100ms);

  auto first = lock.Acquire("first");
  const auto epoch = first.Epoch();
  first.Release();
  first.Release();
  assert(!first.Active());
  assert(!lock.HeldByCurrentThread());

  auto second = lock.Acquire("second");
  assert(second.Epoch() > epoch);
  assert(second.Guards(lock));

  auto moved = std::move(second);
  assert(moved.Active());
  assert(!second.Active());
}

void TestCriticalSectionIsExclusive() {
  MutationLock             lock(2s);
  int                      in_section = 0;
  int                      max_seen   = 0;
  std::vector<std::thread> workers;

  for (int t = 0; t < 8; ++t) {
    workers.emplace_back([&] {
      for (int i = 0; i < 50; ++i) {
        auto guard = lock.Acquire("worker");
        ++in_section;
        max_seen = std::max(max_seen, in_section);
        --in_section;
      }
    });
  }
  for (auto& worker : workers) worker.join();
  assert(max_seen == 1);
}

} // namespace

int main() {
  TestReentrantAcquireIsRejected();
  TestBoundedWaitReportsBusy();
  TestReleaseIsIdempotentAndEpochsAdvance();
  TestCriticalSectionIsExclusive();

  std::cout << "backoffice_unit_mutation_lock: pass\n";
  return 0;
}
