#include "internal/util/numeric.hpp"

#include <cassert>
#include <iostream>
#include <limits>

#include "internal/util/errors.hpp"

namespace {

using namespace backoffice::util;

void TestParseMoney() {
  assert(ParseMoney("12.50") == 1250);
  assert(ParseMoney("12.5") == 1250);
  assert(ParseMoney("12") == 1200);
  assert(ParseMoney(".05") == 5);
  assert(ParseMoney(" 3.05 ") == 305);
  assert(ParseMoney("-3.05") == -305);
  assert(ParseMoney("0") == 0);
}

void TestParseMoneyRejectsMalformedText() {
  assert(!TryParseMoney(""));
  assert(!TryParseMoney("abc"));
  assert(!TryParseMoney("1.234"));
  assert(!TryParseMoney("1.2x"));
  assert(!TryParseMoney("."));
  assert(!TryParseMoney("99999999999999999999"));

  bool threw = false;
  try {
    (void)ParseMoney("ten");
  } catch (const InvalidInput&) {
    threw = true;
  }
  assert(threw);
}

void TestFormatMoney() {
  assert(FormatMoney(0) == "0.00");
  assert(FormatMoney(5) == "0.05");
  assert(FormatMoney(1250) == "12.50");
  assert(FormatMoney(-305) == "-3.05");
  assert(FormatMoney(std::numeric_limits<Cents>::min()) == "-92233720368547758.08");
}

void TestRepeatedSmallCostsDoNotDrift() {
  Cents total = 0;
  for (int i = 0; i < 1000; ++i) total += ParseMoney("0.10");
  assert(FormatMoney(total) == "100.00");
}

void TestParseInt64() {
  assert(ParseInt64("42") == 42);
  assert(ParseInt64("+7") == 7);
  assert(ParseInt64("-3") == -3);
  assert(!TryParseInt64("4.2"));
  assert(!TryParseInt64(""));
}

} // namespace

int main() {
  TestParseMoney();
  TestParseMoneyRejectsMalformedText();
  TestFormatMoney();
  TestRepeatedSmallCostsDoNotDrift();
  TestParseInt64();

  std::cout << "backoffice_unit_numeric: pass\n";
  return 0;
}
