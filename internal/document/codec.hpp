#pragma once

#include <google/protobuf/struct.pb.h>

#include <string>
#include <string_view>

namespace mlmeta::document {

enum class DocumentFormat {
  kJson,
  kYaml,
};

// "---" prefix means YAML; everything else is treated as JSON.
DocumentFormat Detect(std::string_view bytes);

const char* FormatName(DocumentFormat format);

/*
  Returns the JSON form of a YAML or JSON document.

  JSON input is validated and returned unchanged.

  Throws util::FormatError when the document does not parse.
*/
std::string ToJson(std::string_view bytes);

/*
  Re-encodes JSON into `format`. YAML output starts with "---" so Detect()
  recognises it again.

  Throws util::FormatError when `json` does not parse.
*/
std::string FromJson(std::string_view json, DocumentFormat format);

// JSON text <-> DOM. Both throw util::FormatError.
google::protobuf::Value ParseJson(std::string_view json);
std::string             SerializeJson(const google::protobuf::Value& value);

// Any-format document straight to the DOM.
google::protobuf::Value ParseDocument(std::string_view bytes);

} // namespace mlmeta::document
