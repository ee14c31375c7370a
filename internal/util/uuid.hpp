#pragma once

#include <array>
#include <cstdint>
#include <string>

namespace backoffice::util {

/*
  Random (version 4) identifiers for rows written outside the mutation
  lock, where the sequence allocator cannot be used (audit records).
*/

using UUID = std::array<uint8_t, 16>;

UUID GenerateUUID();

// 8-4-4-4-12 lowercase hex
std::string ToString(const UUID& id);

} // namespace backoffice::util
