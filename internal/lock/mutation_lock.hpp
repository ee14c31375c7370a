#pragma once

#include <atomic>
#include <chrono>
#include <cstdint>
#include <mutex>
#include <thread>

namespace backoffice::lock {

class MutationLock;

/*
  Proof that the caller holds the mutation lock.

  Move-only. Operations that must run inside the critical section (id
  allocation, stock staging) take a `const Guard&` so they cannot be called
  without one. Each acquisition gets a fresh epoch.
*/
class Guard {
 public:
  Guard(Guard&& other) noexcept;
  Guard& operator=(Guard&&) = delete;
  Guard(const Guard&)            = delete;
  Guard& operator=(const Guard&) = delete;
  ~Guard();

  bool Active() const {
    return lock_ != nullptr;
  }

  std::uint64_t Epoch() const {
    return epoch_;
  }

  bool Guards(const MutationLock& lock) const {
    return lock_ == &lock;
  }

  // Releases early. Safe to call more than once.
  void Release();

 private:
  friend class MutationLock;
  Guard(MutationLock* lock, std::uint64_t epoch) : lock_(lock), epoch_(epoch) {
  }

  MutationLock* lock_ = nullptr;
  std::uint64_t epoch_ = 0;
};

/*
  The single coarse critical section every mutation runs in.

  Bounded wait: Acquire throws util::Busy when the lock is not obtained
  within the configured timeout. Not reentrant: acquiring from the thread
  that already holds it throws util::InvalidState instead of deadlocking.
*/
class MutationLock {
 public:
  explicit MutationLock(std::chrono::milliseconds wait_timeout);

  Guard Acquire(const char* operation);

  bool HeldByCurrentThread() const;

  std::chrono::milliseconds WaitTimeout() const {
    return wait_timeout_;
  }

 private:
  friend class Guard;
  void Unlock();

  std::timed_mutex             mutex_;
  std::chrono::milliseconds    wait_timeout_;
  std::atomic<std::thread::id> owner_{};
  std::uint64_t                epoch_ = 0;
};

} // namespace backoffice::lock
