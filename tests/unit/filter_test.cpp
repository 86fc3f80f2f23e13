#include "internal/store/filter/filter_expr.hpp"

#include <cassert>
#include <iostream>
#include <string>

namespace {

using mlmeta::store::AttributeMap;
using mlmeta::store::filter::FilterSyntaxError;
using mlmeta::store::filter::Matches;
using mlmeta::store::filter::ParseFilter;

bool Eval(const std::string& text, const AttributeMap& attributes) {
  return Matches(ParseFilter(text), attributes);
}

AttributeMap RunAttributes() {
  return {
      {"metadata_name", std::string("train")},
      {"status_state", std::string("completed")},
      {"metadata_labels_owner", std::string("alice")},
      {"metadata_iteration", std::int64_t{3}},
      {"status_lasttimeEpoch", std::int64_t{1609459200000000000}},
      {"accuracy", 0.91},
      {"__name", std::string("model.latest")},
  };
}

void TestBlankFilterMatchesEverything() {
  assert(!ParseFilter(""));
  assert(!ParseFilter("   "));
  assert(Eval("", {}));
}

void TestComparisons() {
  const auto attributes = RunAttributes();
  assert(Eval(R"(metadata_name == "train")", attributes));
  assert(Eval("metadata_name = 'train'", attributes));
  assert(!Eval(R"(metadata_name != "train")", attributes));
  assert(Eval("metadata_iteration >= 3", attributes));
  assert(!Eval("metadata_iteration > 3", attributes));
  assert(Eval("accuracy > 0.9", attributes));
  assert(Eval("metadata_iteration < 3.5", attributes));
  // Exact int64 comparison at nanosecond scale.
  assert(Eval("status_lasttimeEpoch > 1609459199999999999", attributes));
  assert(!Eval("status_lasttimeEpoch > 1609459200000000000", attributes));
}

void TestMissingAttributesAndTypeMismatchAreFalse() {
  const auto attributes = RunAttributes();
  assert(!Eval(R"(missing == "x")", attributes));
  assert(!Eval("metadata_name == 3", attributes));
  assert(!Eval(R"(metadata_iteration == "3")", attributes));
}

void TestFunctions() {
  const auto attributes = RunAttributes();
  assert(Eval("exists(metadata_labels_owner)", attributes));
  assert(!Eval("exists(metadata_labels_team)", attributes));
  assert(Eval("contains(metadata_labels_owner, 'lic')", attributes));
  assert(Eval("starts(metadata_name, 'tr')", attributes));
  assert(Eval(R"(ends(__name, "latest"))", attributes));
  assert(!Eval(R"(ends(__name, "v1"))", attributes));
  assert(Eval("EXISTS(metadata_name)", attributes));
}

void TestBooleanOperators() {
  const auto attributes = RunAttributes();
  assert(Eval(R"(metadata_name == "train" AND status_state == "completed")", attributes));
  assert(!Eval(R"(metadata_name == "train" and status_state == "running")", attributes));
  assert(Eval(R"(status_state == "running" OR status_state == "completed")", attributes));
  assert(Eval(R"(NOT status_state == "running")", attributes));
  assert(Eval(R"((status_state == "running" OR metadata_iteration == 3) AND exists(__name))", attributes));
}

void TestEscapedStringLiterals() {
  AttributeMap attributes{{"path", std::string(R"(C:\"dir")")}};
  assert(Eval(R"(path == "C:\\\"dir\"")", attributes));
  assert(Eval(R"(contains(path, '\"'))", attributes));
}

void TestSyntaxErrors() {
  const char* bad[] = {"metadata_name ==", "(a == 1", "a == 'unterminated", "frobnicate(a)", "a == 1 b", "a ! 1"};
  for (const auto* text : bad) {
    bool threw = false;
    try {
      (void)ParseFilter(text);
    } catch (const FilterSyntaxError&) {
      threw = true;
    }
    assert(threw);
  }
}

} // namespace

int main() {
  TestBlankFilterMatchesEverything();
  TestComparisons();
  TestMissingAttributesAndTypeMismatchAreFalse();
  TestFunctions();
  TestBooleanOperators();
  TestEscapedStringLiterals();
  TestSyntaxErrors();

  std::cout << "mlmeta_unit_filter: pass\n";
  return 0;
}
