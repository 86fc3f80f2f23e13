#include "internal/document/merge_patch.hpp"

#include <cassert>
#include <iostream>
#include <string>

#include "internal/document/codec.hpp"
#include "internal/util/errors.hpp"

namespace {

using google::protobuf::Value;
using mlmeta::document::ExpandPatch;
using mlmeta::document::Merge;
using mlmeta::document::ParseJson;
using mlmeta::document::SplitPatchPath;

// Structural equality, independent of key order and whitespace.
bool SameJson(const std::string& a, const std::string& b) {
  return ParseJson(a).DebugString() == ParseJson(b).DebugString();
}

void TestSplitPatchPath() {
  assert((SplitPatchPath("a.b.c") == std::vector<std::string>{"a", "b", "c"}));
  assert((SplitPatchPath(R"(metadata.labels.app\.kubernetes\.io)") ==
          std::vector<std::string>{"metadata", "labels", "app.kubernetes.io"}));
  assert((SplitPatchPath("single") == std::vector<std::string>{"single"}));
}

void TestNestedReplaceAndInsert() {
  assert(SameJson(Merge(R"({"a":1,"b":{"c":2}})", R"({"b.c":5,"d":"x"})"), R"({"a":1,"b":{"c":5},"d":"x"})"));
}

void TestMissingIntermediatesAreCreated() {
  assert(SameJson(Merge("{}", R"({"status.results.loss":0.1})"), R"({"status":{"results":{"loss":0.1}}})"));
  // A scalar in the way becomes an object.
  assert(SameJson(Merge(R"({"status":"done"})", R"({"status.state":"completed"})"), R"({"status":{"state":"completed"}})"));
}

void TestValuesReplaceWholesale() {
  assert(SameJson(Merge(R"({"status":{"state":"running","iter":3}})", R"({"status":{"state":"completed"}})"),
                  R"({"status":{"state":"completed"}})"));
  assert(SameJson(Merge(R"({"a":[1,2]})", R"({"a":null})"), R"({"a":null})"));
}

void TestArrayIndexes() {
  assert(SameJson(Merge(R"({"a":[1,2,3]})", R"({"a.1":9})"), R"({"a":[1,9,3]})"));
  assert(SameJson(Merge(R"({"a":[1]})", R"({"a.1":2})"), R"({"a":[1,2]})"));
  assert(SameJson(Merge(R"({"a":[1]})", R"({"a.-1":2})"), R"({"a":[1,2]})"));
  assert(SameJson(Merge(R"({"a":[1]})", R"({"a.3":4})"), R"({"a":[1,null,null,4]})"));
  assert(SameJson(Merge(R"({"a":[{"x":1}]})", R"({"a.0.x":2})"), R"({"a":[{"x":2}]})"));
}

void TestFarIndexesAreRejected() {
  const char* far_patches[] = {
      R"({"status.results.4000000000": 1})",
      R"({"status.results.18446744073709551615": 1})",
      R"({"status.results.1026": 1})",
  };
  for (const auto* patch : far_patches) {
    bool threw = false;
    try {
      (void)Merge(R"({"status":{"results":[1]}})", patch);
    } catch (const mlmeta::util::ParseError&) {
      threw = true;
    }
    assert(threw);
  }

  // Padding up to 1024 nulls is still allowed.
  const auto padded = ParseJson(Merge(R"({"a":[1]})", R"({"a.1025":2})"));
  assert(padded.struct_value().fields().at("a").list_value().values_size() == 1026);
}

void TestEscapedDotsStayInKey() {
  assert(SameJson(Merge("{}", R"({"labels.app\\.io":"web"})"), R"({"labels":{"app.io":"web"}})"));
}

void TestOverlappingKeysApplyInOrder() {
  // "b" sorts before "b.c": the nested key lands on the replaced object.
  assert(SameJson(Merge("{}", R"({"b.c":1,"b":{"d":2}})"), R"({"b":{"d":2,"c":1}})"));
}

void TestExpandPatch() {
  assert(SameJson(ExpandPatch(R"({"metadata.labels.owner":"alice","status.state":"done"})"),
                  R"({"metadata":{"labels":{"owner":"alice"}},"status":{"state":"done"}})"));
}

void TestPatchErrors() {
  const char* bad_patches[] = {"[1,2]", "\"text\"", "{", "3"};
  for (const auto* patch : bad_patches) {
    bool threw = false;
    try {
      (void)Merge("{}", patch);
    } catch (const mlmeta::util::ParseError&) {
      threw = true;
    }
    assert(threw);
  }

  bool threw = false;
  try {
    (void)Merge("{not json", R"({"a":1})");
  } catch (const mlmeta::util::FormatError&) {
    threw = true;
  }
  assert(threw);
}

} // namespace

int main() {
  TestSplitPatchPath();
  TestNestedReplaceAndInsert();
  TestMissingIntermediatesAreCreated();
  TestValuesReplaceWholesale();
  TestArrayIndexes();
  TestFarIndexesAreRejected();
  TestEscapedDotsStayInKey();
  TestOverlappingKeysApplyInOrder();
  TestExpandPatch();
  TestPatchErrors();

  std::cout << "mlmeta_unit_merge_patch: pass\n";
  return 0;
}
