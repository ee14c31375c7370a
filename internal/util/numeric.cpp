#include "numeric.hpp"

#include <charconv>
#include <cstdlib>
#include <limits>

#include "internal/util/errors.hpp"

namespace backoffice::util {

namespace {

std::string_view Trim(std::string_view text) {
  while (!text.empty() && (text.front() == ' ' || text.front() == '\t')) text.remove_prefix(1);
  while (!text.empty() && (text.back() == ' ' || text.back() == '\t')) text.remove_suffix(1);
  return text;
}

} // namespace

std::optional<std::int64_t> TryParseInt64(std::string_view text) {
  text = Trim(text);
  if (text.empty()) return std::nullopt;

  std::int64_t value = 0;
  const auto* first  = text.data();
  const auto* last   = text.data() + text.size();
  if (*first == '+') ++first;

  auto [ptr, ec] = std::from_chars(first, last, value);
  if (ec != std::errc{} || ptr != last) return std::nullopt;
  return value;
}

std::int64_t ParseInt64(std::string_view text) {
  auto value = TryParseInt64(text);
  if (!value) throw InvalidInput("not an integer: '" + std::string(text) + "'");
  return *value;
}

std::optional<Cents> TryParseMoney(std::string_view text) {
  text = Trim(text);
  if (text.empty()) return std::nullopt;

  bool negative = false;
  if (text.front() == '-' || text.front() == '+') {
    negative = text.front() == '-';
    text.remove_prefix(1);
  }

  const auto dot           = text.find('.');
  std::string_view whole   = text.substr(0, dot);
  std::string_view fraction = dot == std::string_view::npos ? std::string_view{} : text.substr(dot + 1);

  if (whole.empty() && fraction.empty()) return std::nullopt;
  if (fraction.size() > 2) return std::nullopt;

  std::int64_t units = 0;
  if (!whole.empty()) {
    auto [ptr, ec] = std::from_chars(whole.data(), whole.data() + whole.size(), units);
    if (ec != std::errc{} || ptr != whole.data() + whole.size()) return std::nullopt;
  }

  std::int64_t cents = 0;
  for (std::size_t i = 0; i < 2; ++i) {
    cents *= 10;
    if (i < fraction.size()) {
      const char c = fraction[i];
      if (c < '0' || c > '9') return std::nullopt;
      cents += c - '0';
    }
  }

  if (units > (std::numeric_limits<std::int64_t>::max() - cents) / 100) return std::nullopt;

  const Cents total = units * 100 + cents;
  return negative ? -total : total;
}

Cents ParseMoney(std::string_view text) {
  auto value = TryParseMoney(text);
  if (!value) throw InvalidInput("not a money amount: '" + std::string(text) + "'");
  return *value;
}

std::string FormatMoney(Cents amount) {
  const bool   negative  = amount < 0;
  // avoid overflow on INT64_MIN by working in unsigned space
  const auto   magnitude = negative ? 0 - static_cast<std::uint64_t>(amount) : static_cast<std::uint64_t>(amount);
  std::string  out       = std::to_string(magnitude / 100);
  const auto   fraction  = magnitude % 100;

  out.push_back('.');
  out.push_back(static_cast<char>('0' + fraction / 10));
  out.push_back(static_cast<char>('0' + fraction % 10));
  return negative ? "-" + out : out;
}

} // namespace backoffice::util
