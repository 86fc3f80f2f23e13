#pragma once

#include <grpcpp/grpcpp.h>

#include <memory>

#include "internal/service/metadata_service.hpp"
#include "mlmeta/v1.hpp"
#include "mlmeta/v1/metadata_service.grpc.pb.h"

namespace mlmeta::grpc {

class MetadataServer final : public mlmeta::v1::MetadataService::Service {
 public:
  explicit MetadataServer(std::shared_ptr<mlmeta::service::MetadataService> svc);

  ::grpc::Status StoreRun(::grpc::ServerContext*, const mlmeta::api::StoreRunRequest*, google::protobuf::Empty*) override;

  ::grpc::Status UpdateRun(::grpc::ServerContext*, const mlmeta::api::UpdateRunRequest*, google::protobuf::Empty*) override;

  ::grpc::Status GetRun(::grpc::ServerContext*, const mlmeta::api::GetRunRequest*, mlmeta::api::DocumentResponse*) override;

  ::grpc::Status DeleteRun(::grpc::ServerContext*, const mlmeta::api::DeleteRunRequest*, google::protobuf::Empty*) override;

  ::grpc::Status ListRuns(::grpc::ServerContext*, const mlmeta::api::ListRunsRequest*, mlmeta::api::DocumentResponse*) override;

  ::grpc::Status DeleteRuns(::grpc::ServerContext*, const mlmeta::api::DeleteRunsRequest*, mlmeta::api::DeleteByQueryResponse*) override;

  ::grpc::Status StoreArtifact(::grpc::ServerContext*, const mlmeta::api::StoreArtifactRequest*, google::protobuf::Empty*) override;

  ::grpc::Status GetArtifact(::grpc::ServerContext*, const mlmeta::api::GetArtifactRequest*, mlmeta::api::DocumentResponse*) override;

  ::grpc::Status DeleteArtifact(::grpc::ServerContext*, const mlmeta::api::DeleteArtifactRequest*, google::protobuf::Empty*) override;

  ::grpc::Status ListArtifacts(::grpc::ServerContext*, const mlmeta::api::ListArtifactsRequest*, mlmeta::api::DocumentResponse*) override;

  ::grpc::Status DeleteArtifacts(::grpc::ServerContext*, const mlmeta::api::DeleteArtifactsRequest*,
                                 mlmeta::api::DeleteByQueryResponse*) override;

  ::grpc::Status StoreLog(::grpc::ServerContext*, const mlmeta::api::StoreLogRequest*, google::protobuf::Empty*) override;

  ::grpc::Status GetLog(::grpc::ServerContext*, const mlmeta::api::GetLogRequest*, mlmeta::api::DocumentResponse*) override;

 private:
  std::shared_ptr<mlmeta::service::MetadataService> service_;
};

} // namespace mlmeta::grpc
