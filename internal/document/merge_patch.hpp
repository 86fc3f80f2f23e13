#pragma once

#include <google/protobuf/struct.pb.h>

#include <string>
#include <string_view>
#include <vector>

namespace mlmeta::document {

/*
  Dot-path partial updates.

  A patch is a flat JSON object whose keys are dot paths into the target
  document and whose values replace whatever sits at that path:

    {"a":1,"b":{"c":2}}  +  {"b.c":5,"d":"x"}  ->  {"a":1,"b":{"c":5},"d":"x"}

  Missing intermediate objects are created and scalars on the way are
  replaced by objects. A non-negative integer component indexes an array
  (index == size appends, "-1" appends, larger indexes pad with null).
  "\." is a literal dot inside a key. Keys are applied in lexicographic
  order, so the longer of two overlapping keys wins.
*/

// Splits a patch key into path components, honouring "\." escapes.
std::vector<std::string> SplitPatchPath(std::string_view key);

// Applies `patch` to `document` in place.
void ApplyPatch(const google::protobuf::Struct& patch, google::protobuf::Value* document);

/*
  Merges patch_json onto old_json and returns the new JSON text.

  Throws:
    util::ParseError   patch_json is not a JSON object
    util::FormatError  old_json is not valid JSON
*/
std::string Merge(std::string_view old_json, std::string_view patch_json);

// The nested document a patch describes (the patch merged onto {}).
std::string ExpandPatch(std::string_view patch_json);

} // namespace mlmeta::document
