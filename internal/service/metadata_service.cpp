#include "metadata_service.hpp"

#include <cstdint>
#include <exception>
#include <memory>
#include <string>
#include <string_view>
#include <type_traits>
#include <utility>
#include <vector>

#include "internal/document/attribute_encoder.hpp"
#include "internal/document/codec.hpp"
#include "internal/document/envelope.hpp"
#include "internal/document/merge_patch.hpp"
#include "internal/observability/logging.hpp"
#include "internal/observability/spans.hpp"
#include "internal/query/filter_builder.hpp"
#include "internal/query/listing.hpp"
#include "internal/store/api/document_store.hpp"
#include "internal/util/errors.hpp"

namespace mlmeta::service {

using namespace mlmeta::api;

namespace {

constexpr const char* kDefaultTag = "latest";
constexpr const char* kAnyTag     = "*";

constexpr int kStatusNotFound = 404;

std::string RunDir(const std::string& project) {
  return "/run/" + project + "/";
}

std::string RunPath(const std::string& project, const std::string& uid) {
  return RunDir(project) + uid;
}

std::string ArtifactDir(const std::string& project) {
  return "/artifact/" + project + "/";
}

std::string ArtifactPath(const std::string& project, const std::string& key, const std::string& suffix) {
  return ArtifactDir(project) + key + "." + suffix;
}

std::string LogPath(const std::string& project, const std::string& uid) {
  return "/log/" + project + "-" + uid;
}

void Require(const std::string& value, const char* what) {
  if (value.empty()) {
    throw util::InvalidArgument(std::string("missing ") + what);
  }
}

std::string ResolveTag(const std::string& tag) {
  return tag.empty() ? kDefaultTag : tag;
}

std::vector<std::string> LabelList(const google::protobuf::RepeatedPtrField<std::string>& labels) {
  return {labels.begin(), labels.end()};
}

std::string ReadDocument(store::DocumentStore& store, const std::string& path) {
  auto item = store.GetItem(path, {store::kDataAttribute});
  auto blob = item.GetFieldString(store::kDataAttribute);
  if (!blob) {
    throw util::NotFound("no document stored at " + path);
  }
  return std::move(*blob);
}

// Metadata fields a run patch sets must be well typed on their own.
void ValidatePatchEnvelope(const std::string& patch_json) {
  const auto patched = document::DecodeRunEnvelope(document::ParseJson(document::ExpandPatch(patch_json)), document::DecodeMode::kStrict);
  MLMETA_LOG_DEBUG("run patch validated", {observability::IntField("indexed_fields", static_cast<std::int64_t>(document::Flatten(patched).size()))});
}

DocumentResponse DocumentOf(std::string body) {
  DocumentResponse resp;
  resp.set_body(std::move(body));
  return resp;
}

// Deletes every direct child of `dir` matching `filter`; one failure does
// not stop the rest.
DeleteByQueryResponse DeleteMatching(store::DocumentStore& store, const std::string& dir, const std::string& filter,
                                     observability::RequestSpan& span) {
  span.SetPath(dir);
  DeleteByQueryResponse resp;

  std::unique_ptr<store::ItemCursor> cursor;
  try {
    cursor = store.Query({dir, {store::kNameAttribute}, filter});
  } catch (const util::NotFound&) {
    return resp;
  }

  for (const auto& item : cursor->All()) {
    const auto name = item.GetFieldString(store::kNameAttribute).value_or(store::BaseName(item.path));
    const auto path = dir + name;
    try {
      store.DeleteObject(path);
      resp.set_deleted(resp.deleted() + 1);
    } catch (const util::NotFound& e) {
      auto* failure = resp.add_failures();
      failure->set_path(path);
      failure->set_status_code(kStatusNotFound);
      failure->set_message(e.what());
    } catch (const util::BackendError& e) {
      auto* failure = resp.add_failures();
      failure->set_path(path);
      failure->set_status_code(e.StatusCode());
      failure->set_message(e.what());
    }
  }

  span.SetDeleteCounts(resp.deleted(), resp.failures_size());
  MLMETA_LOG_INFO("deleted by query", {observability::StringField("dir", dir), observability::IntField("deleted", resp.deleted()),
                                       observability::IntField("failed", resp.failures_size())});
  return resp;
}

observability::RequestOutcome ClassifyFailure(const std::exception& ex) {
  if (dynamic_cast<const util::NotFound*>(&ex)) {
    return observability::RequestOutcome::kNotFound;
  }
  if (dynamic_cast<const util::InvalidArgument*>(&ex) || dynamic_cast<const util::FormatError*>(&ex) ||
      dynamic_cast<const util::ParseError*>(&ex)) {
    return observability::RequestOutcome::kRejected;
  }
  if (dynamic_cast<const util::BackendError*>(&ex)) {
    return observability::RequestOutcome::kBackendError;
  }
  return observability::RequestOutcome::kInternal;
}

// Runs `fn(span)` inside a request span; failures are classified, recorded
// on the span and logged, then rethrown.
template <typename Fn>
auto ObserveRpc(std::string_view route, const std::string& project, Fn&& fn) {
  observability::RequestSpan span(route, project);

  try {
    if constexpr (std::is_void_v<std::invoke_result_t<Fn, observability::RequestSpan&>>) {
      fn(span);
      span.Finish(observability::RequestOutcome::kOk);
      return;
    } else {
      auto result = fn(span);
      span.Finish(observability::RequestOutcome::kOk);
      return result;
    }
  } catch (const std::exception& ex) {
    const auto outcome = ClassifyFailure(ex);
    span.Finish(outcome, ex.what());

    const auto level = outcome == observability::RequestOutcome::kBackendError || outcome == observability::RequestOutcome::kInternal
                           ? spdlog::level::err
                           : spdlog::level::debug;
    observability::Log(level, "RPC failed",
                       {observability::StringField("route", route), observability::StringField("project", project),
                        observability::StringField("outcome", observability::OutcomeName(outcome)), observability::StringField("error", ex.what())});
    throw;
  }
}

DocumentResponse ListDocuments(store::DocumentStore& store, const std::string& dir, std::string_view key, const std::string& filter, bool sort,
                               std::size_t limit, observability::RequestSpan& span) {
  span.SetPath(dir);

  std::unique_ptr<store::ItemCursor> cursor;
  try {
    cursor = store.Query({dir, {store::kNameAttribute, store::kDataAttribute, query::kSortAttribute}, filter});
  } catch (const util::NotFound&) {
    span.SetDocumentCount(0);
    return DocumentOf(query::WrapListing(key, {}));
  }

  const auto blobs = query::List(*cursor, sort, limit);
  span.SetDocumentCount(static_cast<std::int64_t>(blobs.size()));
  return DocumentOf(query::WrapListing(key, blobs));
}

} // namespace

MetadataService::MetadataService(ServiceContext ctx) : ctx_(std::move(ctx)) {
}

// ---------------------------------------------------------------------------
// Runs
// ---------------------------------------------------------------------------

void MetadataService::StoreRun(const StoreRunRequest& req) {
  ObserveRpc("MetadataService.StoreRun", req.project(), [&](observability::RequestSpan& span) {
    Require(req.project(), "project");
    Require(req.uid(), "uid");

    const auto path = RunPath(req.project(), req.uid());
    span.SetPath(path);

    auto envelope   = document::DecodeRunEnvelope(document::ParseDocument(req.body()), document::DecodeMode::kStrict);
    auto attributes = document::Flatten(envelope);
    attributes[store::kDataAttribute] = req.body();
    ctx_.store->ReplaceItem(path, attributes);
  });
}

void MetadataService::UpdateRun(const UpdateRunRequest& req) {
  ObserveRpc("MetadataService.UpdateRun", req.project(), [&](observability::RequestSpan& span) {
    Require(req.project(), "project");
    Require(req.uid(), "uid");

    const auto patch_json = document::ToJson(req.patch());
    ValidatePatchEnvelope(patch_json);

    const auto path = RunPath(req.project(), req.uid());
    span.SetPath(path);
    const auto old_body = ReadDocument(*ctx_.store, path);
    const auto format   = document::Detect(old_body);

    const auto new_json = document::Merge(document::ToJson(old_body), patch_json);
    auto       new_body = document::FromJson(new_json, format);

    // Index attributes follow the merged document, not just the patched keys.
    auto envelope   = document::DecodeRunEnvelope(document::ParseJson(new_json), document::DecodeMode::kLenient);
    auto attributes = document::Flatten(envelope);
    attributes[store::kDataAttribute] = std::move(new_body);
    ctx_.store->ReplaceItem(path, attributes);

    MLMETA_LOG_DEBUG("run updated", {observability::StringField("path", path), observability::StringField("format", document::FormatName(format))});
  });
}

DocumentResponse MetadataService::GetRun(const GetRunRequest& req) {
  return ObserveRpc("MetadataService.GetRun", req.project(), [&](observability::RequestSpan& span) {
    Require(req.project(), "project");
    Require(req.uid(), "uid");

    const auto path = RunPath(req.project(), req.uid());
    span.SetPath(path);
    return DocumentOf(query::WrapDocument(ReadDocument(*ctx_.store, path)));
  });
}

void MetadataService::DeleteRun(const DeleteRunRequest& req) {
  ObserveRpc("MetadataService.DeleteRun", req.project(), [&](observability::RequestSpan& span) {
    Require(req.project(), "project");
    Require(req.uid(), "uid");

    const auto path = RunPath(req.project(), req.uid());
    span.SetPath(path);
    ctx_.store->DeleteObject(path);
  });
}

DocumentResponse MetadataService::ListRuns(const ListRunsRequest& req) {
  return ObserveRpc("MetadataService.ListRuns", req.project(), [&](observability::RequestSpan& span) {
    Require(req.project(), "project");

    const auto limit  = query::ParseLimit(req.last(), ctx_.listing.default_run_limit);
    const auto filter = query::BuildRunFilter(LabelList(req.labels()), req.name(), req.state(), req.updated_after_ns());
    return ListDocuments(*ctx_.store, RunDir(req.project()), "runs", filter, req.sort(), limit, span);
  });
}

DeleteByQueryResponse MetadataService::DeleteRuns(const DeleteRunsRequest& req) {
  return ObserveRpc("MetadataService.DeleteRuns", req.project(), [&](observability::RequestSpan& span) {
    Require(req.project(), "project");
    const auto filter = query::BuildRunFilter(LabelList(req.labels()), req.name(), req.state(), 0);
    return DeleteMatching(*ctx_.store, RunDir(req.project()), filter, span);
  });
}

// ---------------------------------------------------------------------------
// Artifacts
// ---------------------------------------------------------------------------

void MetadataService::StoreArtifact(const StoreArtifactRequest& req) {
  ObserveRpc("MetadataService.StoreArtifact", req.project(), [&](observability::RequestSpan& span) {
    Require(req.project(), "project");
    Require(req.uid(), "uid");
    Require(req.key(), "key");

    auto envelope   = document::DecodeArtifactEnvelope(document::ParseDocument(req.body()), document::DecodeMode::kStrict);
    auto attributes = document::Flatten(envelope);
    attributes["name"]                = req.key();
    attributes[store::kDataAttribute] = req.body();

    const auto tagged = ArtifactPath(req.project(), req.key(), ResolveTag(req.tag()));
    span.SetPath(tagged);
    ctx_.store->ReplaceItem(ArtifactPath(req.project(), req.key(), req.uid()), attributes);
    ctx_.store->ReplaceItem(tagged, attributes);
  });
}

DocumentResponse MetadataService::GetArtifact(const GetArtifactRequest& req) {
  return ObserveRpc("MetadataService.GetArtifact", req.project(), [&](observability::RequestSpan& span) {
    Require(req.project(), "project");
    Require(req.key(), "key");

    const auto path = ArtifactPath(req.project(), req.key(), ResolveTag(req.tag()));
    span.SetPath(path);
    return DocumentOf(query::WrapDocument(ReadDocument(*ctx_.store, path)));
  });
}

void MetadataService::DeleteArtifact(const DeleteArtifactRequest& req) {
  ObserveRpc("MetadataService.DeleteArtifact", req.project(), [&](observability::RequestSpan& span) {
    Require(req.project(), "project");
    Require(req.key(), "key");

    const auto path = ArtifactPath(req.project(), req.key(), ResolveTag(req.tag()));
    span.SetPath(path);
    ctx_.store->DeleteObject(path);
  });
}

DocumentResponse MetadataService::ListArtifacts(const ListArtifactsRequest& req) {
  return ObserveRpc("MetadataService.ListArtifacts", req.project(), [&](observability::RequestSpan& span) {
    Require(req.project(), "project");

    const auto tag    = ResolveTag(req.tag());
    const auto limit  = query::ParseLimit(req.last(), 0);
    const auto filter = query::BuildArtifactFilter(LabelList(req.labels()), req.name(), tag == kAnyTag ? "" : tag);
    return ListDocuments(*ctx_.store, ArtifactDir(req.project()), "artifacts", filter, req.sort(), limit, span);
  });
}

DeleteByQueryResponse MetadataService::DeleteArtifacts(const DeleteArtifactsRequest& req) {
  return ObserveRpc("MetadataService.DeleteArtifacts", req.project(), [&](observability::RequestSpan& span) {
    Require(req.project(), "project");
    const auto tag    = ResolveTag(req.tag());
    const auto filter = query::BuildArtifactFilter(LabelList(req.labels()), req.name(), tag == kAnyTag ? "" : tag);
    return DeleteMatching(*ctx_.store, ArtifactDir(req.project()), filter, span);
  });
}

// ---------------------------------------------------------------------------
// Logs
// ---------------------------------------------------------------------------

void MetadataService::StoreLog(const StoreLogRequest& req) {
  ObserveRpc("MetadataService.StoreLog", req.project(), [&](observability::RequestSpan& span) {
    Require(req.project(), "project");
    Require(req.uid(), "uid");

    const auto path = LogPath(req.project(), req.uid());
    span.SetPath(path);
    ctx_.store->PutObject(path, req.body());
  });
}

DocumentResponse MetadataService::GetLog(const GetLogRequest& req) {
  return ObserveRpc("MetadataService.GetLog", req.project(), [&](observability::RequestSpan& span) {
    Require(req.project(), "project");
    Require(req.uid(), "uid");

    const auto path = LogPath(req.project(), req.uid());
    span.SetPath(path);
    return DocumentOf(ctx_.store->GetObject(path));
  });
}

} // namespace mlmeta::service
