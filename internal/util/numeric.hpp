#pragma once

#include <cstdint>
#include <optional>
#include <string>
#include <string_view>

namespace backoffice::util {

/*
  Fixed-point money.

  Amounts are integer cents everywhere in memory and two-decimal strings
  ("12.50", "-3.05") in the record store. No floating point is involved so
  COGS sums do not drift over many small batches.
*/

using Cents = std::int64_t;

std::optional<Cents> TryParseMoney(std::string_view text);

// Throws InvalidInput on malformed text.
Cents ParseMoney(std::string_view text);

std::string FormatMoney(Cents amount);

std::optional<std::int64_t> TryParseInt64(std::string_view text);

// Throws InvalidInput on malformed text.
std::int64_t ParseInt64(std::string_view text);

} // namespace backoffice::util
