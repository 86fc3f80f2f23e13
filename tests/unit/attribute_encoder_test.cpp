#include "internal/document/attribute_encoder.hpp"

#include <cassert>
#include <iostream>
#include <string>
#include <vector>

#include "internal/document/codec.hpp"
#include "internal/document/envelope.hpp"
#include "internal/util/errors.hpp"

namespace {

using mlmeta::document::ArtifactEnvelope;
using mlmeta::document::DecodeArtifactEnvelope;
using mlmeta::document::DecodeMode;
using mlmeta::document::DecodeRunEnvelope;
using mlmeta::document::FieldDescriptor;
using mlmeta::document::Flatten;
using mlmeta::document::kInvalidFloat;
using mlmeta::document::ParseDocument;
using mlmeta::document::ParseJson;
using mlmeta::document::RunEnvelope;
using mlmeta::document::SanitizeAttributeName;
using mlmeta::store::AttributeMap;

// Envelope shape exercising the numeric and boolean field kinds.
struct ModelEnvelope {
  double score  = kInvalidFloat;
  bool   cached = false;

  static const std::vector<FieldDescriptor<ModelEnvelope>>& Fields() {
    static const std::vector<FieldDescriptor<ModelEnvelope>> fields = {
        {"spec.score", "spec.score", &ModelEnvelope::score},
        {"spec.cached", "spec.cached", &ModelEnvelope::cached},
    };
    return fields;
  }
};

const char* kRunJson = R"({
  "metadata": {"name": "train", "uid": "u1", "iteration": 2, "project": "p",
               "labels": {"owner": "alice", "team-x": "ml"}},
  "status": {"state": "completed", "last_update": "2021-01-01 00:00:00.000000",
             "start_time": "not a timestamp"}
})";

void TestSanitizeAttributeName() {
  assert(SanitizeAttributeName("metadata.labels.team-x") == "metadata_labels_team_x");
  assert(SanitizeAttributeName("already_ok_09") == "already_ok_09");
  assert(SanitizeAttributeName("a b/c") == "a_b_c");
}

void TestRunAttributes() {
  const auto attributes = Flatten(DecodeRunEnvelope(ParseJson(kRunJson), DecodeMode::kStrict));

  assert(std::get<std::string>(attributes.at("metadata_name")) == "train");
  assert(std::get<std::string>(attributes.at("metadata_uid")) == "u1");
  assert(std::get<std::int64_t>(attributes.at("metadata_iteration")) == 2);
  assert(std::get<std::string>(attributes.at("metadata_project")) == "p");
  assert(std::get<std::string>(attributes.at("metadata_labels_owner")) == "alice");
  assert(std::get<std::string>(attributes.at("metadata_labels_team_x")) == "ml");
  assert(std::get<std::string>(attributes.at("status_state")) == "completed");

  // Timestamps are indexed as epoch nanoseconds only.
  assert(std::get<std::int64_t>(attributes.at("status_lasttimeEpoch")) == 1609459200LL * 1'000'000'000);
  assert(attributes.count("status_lasttime") == 0);

  // Not timestamp-shaped: copied as a plain string.
  assert(std::get<std::string>(attributes.at("status_starttime")) == "not a timestamp");
  assert(attributes.count("status_starttimeEpoch") == 0);
}

void TestAbsentFieldsProduceNoAttributes() {
  const auto attributes = Flatten(DecodeRunEnvelope(ParseJson(R"({"metadata":{"name":"only"},"status":null})"), DecodeMode::kStrict));
  assert(attributes.size() == 1);
  assert(attributes.count("metadata_name") == 1);

  assert(Flatten(RunEnvelope{}).empty());
  assert(Flatten(DecodeRunEnvelope(ParseJson("null"), DecodeMode::kStrict)).empty());
}

void TestZeroValuesStillProduceAttributes() {
  const auto attributes = Flatten(DecodeRunEnvelope(ParseJson(R"({"metadata":{"name":"","iteration":0},"status":{"state":""}})"),
                                                    DecodeMode::kStrict));
  assert(attributes.size() == 3);
  assert(std::get<std::string>(attributes.at("metadata_name")).empty());
  assert(std::get<std::int64_t>(attributes.at("metadata_iteration")) == 0);
  assert(std::get<std::string>(attributes.at("status_state")).empty());

  const auto model = Flatten(mlmeta::document::DecodeEnvelope<ModelEnvelope>(ParseJson(R"({"spec":{"score":0,"cached":false}})"),
                                                                              DecodeMode::kStrict));
  assert(std::get<double>(model.at("spec_score")) == 0.0);
  assert(!std::get<bool>(model.at("spec_cached")));
}

void TestKeysMatchCaseInsensitively() {
  const auto envelope = DecodeRunEnvelope(ParseJson(R"({"Metadata":{"NAME":"train","name":"exact"},"STATUS":{"State":"running"}})"),
                                          DecodeMode::kStrict);
  assert(envelope.name == "exact");
  assert(envelope.state == "running");
}

void TestFlattenIsIdempotent() {
  const auto envelope = DecodeRunEnvelope(ParseJson(kRunJson), DecodeMode::kStrict);
  assert(Flatten(envelope) == Flatten(envelope));
}

void TestYamlAndJsonDocumentsIndexAlike() {
  const auto yaml = "---\n"
                    "metadata:\n"
                    "  name: train\n"
                    "  uid: u1\n"
                    "  iteration: 2\n"
                    "  project: p\n"
                    "  labels:\n"
                    "    owner: alice\n"
                    "    team-x: ml\n"
                    "status:\n"
                    "  state: completed\n"
                    "  last_update: \"2021-01-01 00:00:00.000000\"\n"
                    "  start_time: not a timestamp\n";
  assert(Flatten(DecodeRunEnvelope(ParseDocument(yaml), DecodeMode::kStrict)) ==
         Flatten(DecodeRunEnvelope(ParseJson(kRunJson), DecodeMode::kStrict)));
}

void TestStrictModeRejectsMistypedFields() {
  const char* bad[] = {
      R"({"metadata":{"iteration":"two"}})",
      R"({"metadata":{"iteration":2.5}})",
      R"({"metadata":{"labels":{"owner":3}}})",
      R"({"metadata":"flat"})",
      R"([1,2])",
  };
  for (const auto* json : bad) {
    bool threw = false;
    try {
      (void)DecodeRunEnvelope(ParseJson(json), DecodeMode::kStrict);
    } catch (const mlmeta::util::FormatError&) {
      threw = true;
    }
    assert(threw);
  }
}

void TestLenientModeKeepsSentinels() {
  const auto envelope = DecodeRunEnvelope(ParseJson(R"({"metadata":{"name":"train","iteration":"two"}})"), DecodeMode::kLenient);
  assert(envelope.name == "train");
  assert(envelope.iteration == mlmeta::document::kInvalidInt);

  const auto attributes = Flatten(envelope);
  assert(attributes.count("metadata_iteration") == 0);
  assert(attributes.count("metadata_name") == 1);
}

void TestArtifactAttributes() {
  const auto attributes =
      Flatten(DecodeArtifactEnvelope(ParseJson(R"({"key":"model","labels":{"stage":"prod"},"extra":1})"), DecodeMode::kStrict));
  assert(attributes.size() == 2);
  assert(std::get<std::string>(attributes.at("name")) == "model");
  assert(std::get<std::string>(attributes.at("labels_stage")) == "prod");
}

void TestNumericAndBooleanFields() {
  const auto envelope = mlmeta::document::DecodeEnvelope<ModelEnvelope>(ParseJson(R"({"spec":{"score":0.75,"cached":true}})"),
                                                                         DecodeMode::kStrict);
  const auto attributes = Flatten(envelope);
  assert(std::get<double>(attributes.at("spec_score")) == 0.75);
  assert(std::get<bool>(attributes.at("spec_cached")));

  // Infinity is the sentinel; booleans are always emitted.
  const auto empty = Flatten(ModelEnvelope{});
  assert(empty.count("spec_score") == 0);
  assert(!std::get<bool>(empty.at("spec_cached")));
}

} // namespace

int main() {
  TestSanitizeAttributeName();
  TestRunAttributes();
  TestAbsentFieldsProduceNoAttributes();
  TestZeroValuesStillProduceAttributes();
  TestKeysMatchCaseInsensitively();
  TestFlattenIsIdempotent();
  TestYamlAndJsonDocumentsIndexAlike();
  TestStrictModeRejectsMistypedFields();
  TestLenientModeKeepsSentinels();
  TestArtifactAttributes();
  TestNumericAndBooleanFields();

  std::cout << "mlmeta_unit_attribute_encoder: pass\n";
  return 0;
}
