#pragma once

#include <cstdint>
#include <map>
#include <optional>
#include <string>
#include <string_view>

#include "internal/db/api/record_store.hpp"
#include "internal/lock/mutation_lock.hpp"
#include "internal/sequence/entity_type.hpp"

namespace backoffice::sequence {

/*
  Issues prefixed, zero-padded, monotonic identifiers ("SALE0042").

  The last issued number is never stored: every call scans the owning
  collection's key column for the highest numeric suffix. Sale and
  quotation ids also count their line rows, so lines orphaned by a failed
  header write keep their id out of circulation. Correctness
  relies on the mutation lock serializing allocation with the write that
  lands the id, hence the Guard parameter.

  Ids issued under the current guard epoch but not yet written are
  remembered, so one critical section can allocate several ids of a kind.
*/
class SequenceAllocator {
 public:
  SequenceAllocator(db::RecordStore& store, lock::MutationLock& lock, unsigned pad_width = 4);

  std::string NextId(const lock::Guard& guard, EntityType type);

  // Digits after `prefix`, or nullopt when `key` is not prefix + digits.
  static std::optional<std::int64_t> ParseSuffix(std::string_view key, std::string_view prefix);

  // prefix + value left-padded with zeros to `width`; wider values are kept whole.
  static std::string Format(std::string_view prefix, std::int64_t value, unsigned width);

 private:
  db::RecordStore&    store_;
  lock::MutationLock& lock_;
  unsigned            pad_width_;

  // guarded by the mutation lock
  std::uint64_t                        epoch_ = 0;
  std::map<EntityType, std::int64_t>   issued_;
};

} // namespace backoffice::sequence
