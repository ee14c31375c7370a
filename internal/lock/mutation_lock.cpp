#include "mutation_lock.hpp"

#include "internal/observability/logging.hpp"
#include "internal/util/errors.hpp"

namespace backoffice::lock {

Guard::Guard(Guard&& other) noexcept : lock_(other.lock_), epoch_(other.epoch_) {
  other.lock_ = nullptr;
}

Guard::~Guard() {
  Release();
}

void Guard::Release() {
  if (lock_) {
    lock_->Unlock();
    lock_ = nullptr;
  }
}

MutationLock::MutationLock(std::chrono::milliseconds wait_timeout) : wait_timeout_(wait_timeout) {
}

Guard MutationLock::Acquire(const char* operation) {
  if (HeldByCurrentThread()) {
    throw util::InvalidState(std::string("mutation lock already held by this thread (") + operation + ")");
  }

  const auto started = std::chrono::steady_clock::now();
  if (!mutex_.try_lock_for(wait_timeout_)) {
    BACKOFFICE_LOG_WARN("mutation lock wait timed out",
                        {observability::StringField("operation", operation), observability::IntField("wait_ms", wait_timeout_.count())});
    throw util::Busy(std::string("system busy, please try again (") + operation + ")");
  }

  owner_.store(std::this_thread::get_id());
  const auto waited = std::chrono::duration_cast<std::chrono::milliseconds>(std::chrono::steady_clock::now() - started);
  BACKOFFICE_LOG_DEBUG("mutation lock acquired", {observability::StringField("operation", operation), observability::IntField("waited_ms", waited.count()),
                                                  observability::IntField("epoch", static_cast<std::int64_t>(epoch_ + 1))});
  return Guard(this, ++epoch_);
}

bool MutationLock::HeldByCurrentThread() const {
  return owner_.load() == std::this_thread::get_id();
}

void MutationLock::Unlock() {
  owner_.store(std::thread::id{});
  mutex_.unlock();
}

} // namespace backoffice::lock
