#include "sequence_allocator.hpp"

#include <algorithm>
#include <limits>

#include "internal/observability/logging.hpp"
#include "internal/util/errors.hpp"

namespace backoffice::sequence {

SequenceAllocator::SequenceAllocator(db::RecordStore& store, lock::MutationLock& lock, unsigned pad_width)
    : store_(store), lock_(lock), pad_width_(pad_width) {
}

std::optional<std::int64_t> SequenceAllocator::ParseSuffix(std::string_view key, std::string_view prefix) {
  if (key.size() <= prefix.size() || key.substr(0, prefix.size()) != prefix) return std::nullopt;

  std::int64_t value = 0;
  for (char c : key.substr(prefix.size())) {
    if (c < '0' || c > '9') return std::nullopt;
    if (value > (std::numeric_limits<std::int64_t>::max() - (c - '0')) / 10) return std::nullopt;
    value = value * 10 + (c - '0');
  }
  return value;
}

std::string SequenceAllocator::Format(std::string_view prefix, std::int64_t value, unsigned width) {
  std::string digits = std::to_string(value);
  if (digits.size() < width) digits.insert(0, width - digits.size(), '0');
  return std::string(prefix) + digits;
}

std::string SequenceAllocator::NextId(const lock::Guard& guard, EntityType type) {
  if (!guard.Active() || !guard.Guards(lock_)) {
    throw util::InvalidState("id allocation requires the held mutation lock");
  }

  if (guard.Epoch() != epoch_) {
    epoch_ = guard.Epoch();
    issued_.clear();
  }

  const auto& info = Info(type);

  std::int64_t highest = 0;
  auto         scan    = [&](std::string_view collection, std::string_view column) {
    for (const auto& row : store_.Scan(std::string(collection))) {
      if (auto suffix = ParseSuffix(db::Cell(row, std::string(column)), info.prefix)) {
        highest = std::max(highest, *suffix);
      }
    }
  };
  scan(info.collection, info.key_column);
  if (!info.child_collection.empty()) {
    scan(info.child_collection, info.child_column);
  }

  if (auto it = issued_.find(type); it != issued_.end()) {
    highest = std::max(highest, it->second);
  }

  const std::int64_t next = highest + 1;
  issued_[type]           = next;

  auto id = Format(info.prefix, next, pad_width_);
  BACKOFFICE_LOG_DEBUG("id allocated", {observability::StringField("id", id), observability::IntField("epoch", static_cast<std::int64_t>(epoch_))});
  return id;
}

} // namespace backoffice::sequence
