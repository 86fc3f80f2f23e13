#include "metadata_server.hpp"

#include "grpc_error.hpp"

namespace mlmeta::grpc {

MetadataServer::MetadataServer(std::shared_ptr<mlmeta::service::MetadataService> svc) : service_(std::move(svc)) {
}

::grpc::Status MetadataServer::StoreRun(::grpc::ServerContext*, const mlmeta::api::StoreRunRequest* req, google::protobuf::Empty*) {
  try {
    service_->StoreRun(*req);
    return ::grpc::Status::OK;
  } catch (const std::exception& e) {
    return ToStatus(e);
  }
}

::grpc::Status MetadataServer::UpdateRun(::grpc::ServerContext*, const mlmeta::api::UpdateRunRequest* req, google::protobuf::Empty*) {
  try {
    service_->UpdateRun(*req);
    return ::grpc::Status::OK;
  } catch (const std::exception& e) {
    return ToStatus(e);
  }
}

::grpc::Status MetadataServer::GetRun(::grpc::ServerContext*, const mlmeta::api::GetRunRequest* req, mlmeta::api::DocumentResponse* resp) {
  try {
    *resp = service_->GetRun(*req);
    return ::grpc::Status::OK;
  } catch (const std::exception& e) {
    return ToStatus(e);
  }
}

::grpc::Status MetadataServer::DeleteRun(::grpc::ServerContext*, const mlmeta::api::DeleteRunRequest* req, google::protobuf::Empty*) {
  try {
    service_->DeleteRun(*req);
    return ::grpc::Status::OK;
  } catch (const std::exception& e) {
    return ToStatus(e);
  }
}

::grpc::Status MetadataServer::ListRuns(::grpc::ServerContext*, const mlmeta::api::ListRunsRequest* req, mlmeta::api::DocumentResponse* resp) {
  try {
    *resp = service_->ListRuns(*req);
    return ::grpc::Status::OK;
  } catch (const std::exception& e) {
    return ToStatus(e);
  }
}

::grpc::Status MetadataServer::DeleteRuns(::grpc::ServerContext*, const mlmeta::api::DeleteRunsRequest* req, mlmeta::api::DeleteByQueryResponse* resp) {
  try {
    *resp = service_->DeleteRuns(*req);
    return ::grpc::Status::OK;
  } catch (const std::exception& e) {
    return ToStatus(e);
  }
}

::grpc::Status MetadataServer::StoreArtifact(::grpc::ServerContext*, const mlmeta::api::StoreArtifactRequest* req, google::protobuf::Empty*) {
  try {
    service_->StoreArtifact(*req);
    return ::grpc::Status::OK;
  } catch (const std::exception& e) {
    return ToStatus(e);
  }
}

::grpc::Status MetadataServer::GetArtifact(::grpc::ServerContext*, const mlmeta::api::GetArtifactRequest* req, mlmeta::api::DocumentResponse* resp) {
  try {
    *resp = service_->GetArtifact(*req);
    return ::grpc::Status::OK;
  } catch (const std::exception& e) {
    return ToStatus(e);
  }
}

::grpc::Status MetadataServer::DeleteArtifact(::grpc::ServerContext*, const mlmeta::api::DeleteArtifactRequest* req, google::protobuf::Empty*) {
  try {
    service_->DeleteArtifact(*req);
    return ::grpc::Status::OK;
  } catch (const std::exception& e) {
    return ToStatus(e);
  }
}

::grpc::Status MetadataServer::ListArtifacts(::grpc::ServerContext*, const mlmeta::api::ListArtifactsRequest* req, mlmeta::api::DocumentResponse* resp) {
  try {
    *resp = service_->ListArtifacts(*req);
    return ::grpc::Status::OK;
  } catch (const std::exception& e) {
    return ToStatus(e);
  }
}

::grpc::Status MetadataServer::DeleteArtifacts(::grpc::ServerContext*, const mlmeta::api::DeleteArtifactsRequest* req, mlmeta::api::DeleteByQueryResponse* resp) {
  try {
    *resp = service_->DeleteArtifacts(*req);
    return ::grpc::Status::OK;
  } catch (const std::exception& e) {
    return ToStatus(e);
  }
}

::grpc::Status MetadataServer::StoreLog(::grpc::ServerContext*, const mlmeta::api::StoreLogRequest* req, google::protobuf::Empty*) {
  try {
    service_->StoreLog(*req);
    return ::grpc::Status::OK;
  } catch (const std::exception& e) {
    return ToStatus(e);
  }
}

::grpc::Status MetadataServer::GetLog(::grpc::ServerContext*, const mlmeta::api::GetLogRequest* req, mlmeta::api::DocumentResponse* resp) {
  try {
    *resp = service_->GetLog(*req);
    return ::grpc::Status::OK;
  } catch (const std::exception& e) {
    return ToStatus(e);
  }
}

} // namespace mlmeta::grpc
