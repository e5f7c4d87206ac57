#include <cassert>
#include <iostream>
#include <limits>
#include <string>

#include "internal/observability/logging.hpp"

namespace {

using market::observability::BoolField;
using market::observability::FormatFields;
using market::observability::IntField;
using market::observability::StringField;
using market::observability::TokenField;

void TestPlainValuesStayBare() {
  assert(FormatFields({}).empty());
  assert((FormatFields({StringField("provider", "gpu-farm"), IntField("milestone", 3), BoolField("verified", true)}) ==
          "provider=gpu-farm milestone=3 verified=true"));
}

void TestTokenFieldKeepsFullWidth() {
  assert(FormatFields({TokenField("amount", std::numeric_limits<uint64_t>::max())}) == "amount=18446744073709551615");
}

void TestValuesThatBreakKeyValueParsingAreQuoted() {
  assert(FormatFields({StringField("error", "bid too low")}) == R"(error="bid too low")");
  assert(FormatFields({StringField("principal", "a=b")}) == R"(principal="a=b")");
  assert(FormatFields({StringField("proof", R"(say "hi")")}) == R"(proof="say \"hi\"")");
  assert(FormatFields({StringField("path", R"(C:\db)")}) == R"(path="C:\\db")");
  assert(FormatFields({StringField("sender", "")}) == R"(sender="")");
}

} // namespace

int main() {
  TestPlainValuesStayBare();
  TestTokenFieldKeepsFullWidth();
  TestValuesThatBreakKeyValueParsingAreQuoted();

  std::cout << "market_unit_logging: pass\n";
  return 0;
}
