#pragma once

#include <google/protobuf/empty.pb.h>

#include "internal/service/service_context.hpp"
#include "mlmeta/v1.hpp"

namespace mlmeta::service {

/*
  Run, artifact and log operations over the document store.

  Errors propagate as the util:: exception types; the transport layer maps
  them to status codes.
*/
class MetadataService {
 public:
  explicit MetadataService(ServiceContext ctx);

  void StoreRun(const mlmeta::api::StoreRunRequest& req);
  void UpdateRun(const mlmeta::api::UpdateRunRequest& req);
  mlmeta::api::DocumentResponse GetRun(const mlmeta::api::GetRunRequest& req);
  void DeleteRun(const mlmeta::api::DeleteRunRequest& req);
  mlmeta::api::DocumentResponse ListRuns(const mlmeta::api::ListRunsRequest& req);
  mlmeta::api::DeleteByQueryResponse DeleteRuns(const mlmeta::api::DeleteRunsRequest& req);

  void StoreArtifact(const mlmeta::api::StoreArtifactRequest& req);
  mlmeta::api::DocumentResponse GetArtifact(const mlmeta::api::GetArtifactRequest& req);
  void DeleteArtifact(const mlmeta::api::DeleteArtifactRequest& req);
  mlmeta::api::DocumentResponse ListArtifacts(const mlmeta::api::ListArtifactsRequest& req);
  mlmeta::api::DeleteByQueryResponse DeleteArtifacts(const mlmeta::api::DeleteArtifactsRequest& req);

  void StoreLog(const mlmeta::api::StoreLogRequest& req);
  mlmeta::api::DocumentResponse GetLog(const mlmeta::api::GetLogRequest& req);

 private:
  ServiceContext ctx_;
};

} // namespace mlmeta::service
