#include <grpcpp/create_channel.h>
#include <grpcpp/security/credentials.h>

#include <iostream>
#include <string>

#include "mlmeta/v1.hpp"
#include "mlmeta/v1/metadata_service.grpc.pb.h"

namespace {

bool Check(const grpc::Status& status, const char* what) {
  if (!status.ok()) {
    std::cerr << what << " failed: " << status.error_message() << '\n';
    return false;
  }
  return true;
}

} // namespace

int main(int argc, char** argv) {
  // Endpoint can be passed on the command line for non-default deployments.
  const std::string target = argc > 1 ? argv[1] : "localhost:50051";

  auto stub = mlmeta::v1::MetadataService::NewStub(grpc::CreateChannel(target, grpc::InsecureChannelCredentials()));

  // Store a run. Only the metadata/status envelope is indexed; the rest of
  // the document is kept verbatim.
  {
    mlmeta::v1::StoreRunRequest req;
    req.set_project("demo");
    req.set_uid("run-1");
    req.set_body(R"({"metadata":{"name":"train","uid":"run-1","labels":{"owner":"alice"}},)"
                 R"("status":{"state":"running","last_update":"2024-01-02 03:04:05.000006"}})");
    google::protobuf::Empty resp;
    grpc::ClientContext     ctx;
    if (!Check(stub->StoreRun(&ctx, req, &resp), "StoreRun")) return 1;
  }

  // Patch nested fields with dot paths.
  {
    mlmeta::v1::UpdateRunRequest req;
    req.set_project("demo");
    req.set_uid("run-1");
    req.set_patch(R"({"status.state":"completed","status.last_update":"2024-01-02 04:00:00.000000"})");
    google::protobuf::Empty resp;
    grpc::ClientContext     ctx;
    if (!Check(stub->UpdateRun(&ctx, req, &resp), "UpdateRun")) return 1;
  }

  // List completed runs owned by alice.
  {
    mlmeta::v1::ListRunsRequest req;
    req.set_project("demo");
    req.set_state("completed");
    req.add_labels("owner=alice");
    req.set_sort(true);
    mlmeta::v1::DocumentResponse resp;
    grpc::ClientContext          ctx;
    if (!Check(stub->ListRuns(&ctx, req, &resp), "ListRuns")) return 1;
    std::cout << resp.body() << '\n';
  }

  return 0;
}
