#include <grpcpp/grpcpp.h>

#include <fstream>
#include <iostream>
#include <iterator>
#include <map>
#include <memory>
#include <sstream>
#include <string>
#include <vector>

#include "internal/util/time.hpp"
#include "mlmeta/v1.hpp"
#include "mlmeta/v1/metadata_service.grpc.pb.h"

using namespace mlmeta::v1;

static void Usage() {
  std::cout << "Usage:\n"
            << "  mlmetactl <addr> store-run <project> <uid> <file|->\n"
            << "  mlmetactl <addr> update-run <project> <uid> <patch-file|->\n"
            << "  mlmetactl <addr> get-run <project> <uid>\n"
            << "  mlmetactl <addr> delete-run <project> <uid>\n"
            << "  mlmetactl <addr> list-runs <project> [name=..] [state=..] [label=..]... [sort=true] [last=N] [after=\"YYYY-MM-DD HH:MM:SS.ffffff\"]\n"
            << "  mlmetactl <addr> delete-runs <project> [name=..] [state=..] [label=..]...\n"
            << "  mlmetactl <addr> store-artifact <project> <uid> <key> <file|-> [tag=..]\n"
            << "  mlmetactl <addr> get-artifact <project> <key> [tag=..]\n"
            << "  mlmetactl <addr> delete-artifact <project> <key> [tag=..]\n"
            << "  mlmetactl <addr> list-artifacts <project> [name=..] [tag=..] [label=..]... [sort=true] [last=N]\n"
            << "  mlmetactl <addr> delete-artifacts <project> [name=..] [tag=..] [label=..]...\n"
            << "  mlmetactl <addr> store-log <project> <uid> <file|->\n"
            << "  mlmetactl <addr> get-log <project> <uid>\n";
}

// "-" reads stdin.
static bool ReadInput(const std::string& path, std::string* out) {
  if (path == "-") {
    out->assign(std::istreambuf_iterator<char>(std::cin), std::istreambuf_iterator<char>());
    return true;
  }
  std::ifstream in(path, std::ios::binary);
  if (!in) {
    std::cerr << "cannot open " << path << "\n";
    return false;
  }
  std::ostringstream buffer;
  buffer << in.rdbuf();
  *out = buffer.str();
  return true;
}

struct Options {
  std::map<std::string, std::string> values;
  std::vector<std::string>           labels;

  std::string Get(const std::string& key) const {
    auto it = values.find(key);
    return it == values.end() ? std::string() : it->second;
  }
};

// Parses trailing key=value arguments; label= may repeat.
static bool ParseOptions(int argc, char** argv, int first, Options* options) {
  for (int i = first; i < argc; ++i) {
    const std::string arg = argv[i];
    const auto        eq  = arg.find('=');
    if (eq == std::string::npos) {
      std::cerr << "expected key=value, got '" << arg << "'\n";
      return false;
    }
    const auto key = arg.substr(0, eq);
    if (key == "label") {
      options->labels.push_back(arg.substr(eq + 1));
    } else {
      options->values[key] = arg.substr(eq + 1);
    }
  }
  return true;
}

static int Report(const grpc::Status& status) {
  std::cerr << status.error_code() << ": " << status.error_message() << "\n";
  return 2;
}

static int PrintDeleteResult(const DeleteByQueryResponse& resp) {
  std::cout << "deleted=" << resp.deleted() << "\n";
  for (const auto& failure : resp.failures()) {
    std::cout << "failed path=" << failure.path() << " status=" << failure.status_code() << " message=" << failure.message() << "\n";
  }
  return resp.failures_size() == 0 ? 0 : 3;
}

template <typename Request>
static void AddLabels(const Options& options, Request* req) {
  for (const auto& label : options.labels) {
    req->add_labels(label);
  }
}

int main(int argc, char** argv) {
  if (argc < 4) {
    Usage();
    return 1;
  }

  std::string addr    = argv[1];
  std::string cmd     = argv[2];
  std::string project = argv[3];

  auto channel = grpc::CreateChannel(addr, grpc::InsecureChannelCredentials());
  auto stub    = MetadataService::NewStub(channel);

  grpc::ClientContext ctx;

  // ------------------------------------------------------------

  if (cmd == "store-run") {
    if (argc < 6) return 1;

    StoreRunRequest req;
    req.set_project(project);
    req.set_uid(argv[4]);
    if (!ReadInput(argv[5], req.mutable_body())) return 1;

    google::protobuf::Empty resp;
    auto                    status = stub->StoreRun(&ctx, req, &resp);
    if (!status.ok()) return Report(status);

    std::cout << "stored\n";
    return 0;
  }

  // ------------------------------------------------------------

  if (cmd == "update-run") {
    if (argc < 6) return 1;

    UpdateRunRequest req;
    req.set_project(project);
    req.set_uid(argv[4]);
    if (!ReadInput(argv[5], req.mutable_patch())) return 1;

    google::protobuf::Empty resp;
    auto                    status = stub->UpdateRun(&ctx, req, &resp);
    if (!status.ok()) return Report(status);

    std::cout << "updated\n";
    return 0;
  }

  // ------------------------------------------------------------

  if (cmd == "get-run") {
    if (argc < 5) return 1;

    GetRunRequest req;
    req.set_project(project);
    req.set_uid(argv[4]);

    DocumentResponse resp;
    auto             status = stub->GetRun(&ctx, req, &resp);
    if (!status.ok()) return Report(status);

    std::cout << resp.body() << "\n";
    return 0;
  }

  // ------------------------------------------------------------

  if (cmd == "delete-run") {
    if (argc < 5) return 1;

    DeleteRunRequest req;
    req.set_project(project);
    req.set_uid(argv[4]);

    google::protobuf::Empty resp;
    auto                    status = stub->DeleteRun(&ctx, req, &resp);
    if (!status.ok()) return Report(status);

    std::cout << "deleted\n";
    return 0;
  }

  // ------------------------------------------------------------

  if (cmd == "list-runs") {
    Options options;
    if (!ParseOptions(argc, argv, 4, &options)) return 1;

    ListRunsRequest req;
    req.set_project(project);
    req.set_name(options.Get("name"));
    req.set_state(options.Get("state"));
    req.set_sort(options.Get("sort") == "true");
    req.set_last(options.Get("last"));
    if (!options.Get("after").empty()) {
      auto after = mlmeta::util::ParseDocumentTimestamp(options.Get("after"));
      if (!after) {
        std::cerr << "after must look like \"2006-01-02 15:04:05.000000\"\n";
        return 1;
      }
      req.set_updated_after_ns(*after);
    }
    AddLabels(options, &req);

    DocumentResponse resp;
    auto             status = stub->ListRuns(&ctx, req, &resp);
    if (!status.ok()) return Report(status);

    std::cout << resp.body() << "\n";
    return 0;
  }

  // ------------------------------------------------------------

  if (cmd == "delete-runs") {
    Options options;
    if (!ParseOptions(argc, argv, 4, &options)) return 1;

    DeleteRunsRequest req;
    req.set_project(project);
    req.set_name(options.Get("name"));
    req.set_state(options.Get("state"));
    AddLabels(options, &req);

    DeleteByQueryResponse resp;
    auto                  status = stub->DeleteRuns(&ctx, req, &resp);
    if (!status.ok()) return Report(status);

    return PrintDeleteResult(resp);
  }

  // ------------------------------------------------------------

  if (cmd == "store-artifact") {
    if (argc < 7) return 1;

    Options options;
    if (!ParseOptions(argc, argv, 7, &options)) return 1;

    StoreArtifactRequest req;
    req.set_project(project);
    req.set_uid(argv[4]);
    req.set_key(argv[5]);
    req.set_tag(options.Get("tag"));
    if (!ReadInput(argv[6], req.mutable_body())) return 1;

    google::protobuf::Empty resp;
    auto                    status = stub->StoreArtifact(&ctx, req, &resp);
    if (!status.ok()) return Report(status);

    std::cout << "stored\n";
    return 0;
  }

  // ------------------------------------------------------------

  if (cmd == "get-artifact") {
    if (argc < 5) return 1;

    Options options;
    if (!ParseOptions(argc, argv, 5, &options)) return 1;

    GetArtifactRequest req;
    req.set_project(project);
    req.set_key(argv[4]);
    req.set_tag(options.Get("tag"));

    DocumentResponse resp;
    auto             status = stub->GetArtifact(&ctx, req, &resp);
    if (!status.ok()) return Report(status);

    std::cout << resp.body() << "\n";
    return 0;
  }

  // ------------------------------------------------------------

  if (cmd == "delete-artifact") {
    if (argc < 5) return 1;

    Options options;
    if (!ParseOptions(argc, argv, 5, &options)) return 1;

    DeleteArtifactRequest req;
    req.set_project(project);
    req.set_key(argv[4]);
    req.set_tag(options.Get("tag"));

    google::protobuf::Empty resp;
    auto                    status = stub->DeleteArtifact(&ctx, req, &resp);
    if (!status.ok()) return Report(status);

    std::cout << "deleted\n";
    return 0;
  }

  // ------------------------------------------------------------

  if (cmd == "list-artifacts") {
    Options options;
    if (!ParseOptions(argc, argv, 4, &options)) return 1;

    ListArtifactsRequest req;
    req.set_project(project);
    req.set_name(options.Get("name"));
    req.set_tag(options.Get("tag"));
    req.set_sort(options.Get("sort") == "true");
    req.set_last(options.Get("last"));
    AddLabels(options, &req);

    DocumentResponse resp;
    auto             status = stub->ListArtifacts(&ctx, req, &resp);
    if (!status.ok()) return Report(status);

    std::cout << resp.body() << "\n";
    return 0;
  }

  // ------------------------------------------------------------

  if (cmd == "delete-artifacts") {
    Options options;
    if (!ParseOptions(argc, argv, 4, &options)) return 1;

    DeleteArtifactsRequest req;
    req.set_project(project);
    req.set_name(options.Get("name"));
    req.set_tag(options.Get("tag"));
    AddLabels(options, &req);

    DeleteByQueryResponse resp;
    auto                  status = stub->DeleteArtifacts(&ctx, req, &resp);
    if (!status.ok()) return Report(status);

    return PrintDeleteResult(resp);
  }

  // ------------------------------------------------------------

  if (cmd == "store-log") {
    if (argc < 6) return 1;

    StoreLogRequest req;
    req.set_project(project);
    req.set_uid(argv[4]);
    if (!ReadInput(argv[5], req.mutable_body())) return 1;

    google::protobuf::Empty resp;
    auto                    status = stub->StoreLog(&ctx, req, &resp);
    if (!status.ok()) return Report(status);

    std::cout << "stored\n";
    return 0;
  }

  // ------------------------------------------------------------

  if (cmd == "get-log") {
    if (argc < 5) return 1;

    GetLogRequest req;
    req.set_project(project);
    req.set_uid(argv[4]);

    DocumentResponse resp;
    auto             status = stub->GetLog(&ctx, req, &resp);
    if (!status.ok()) return Report(status);

    std::cout << resp.body();
    return 0;
  }

  Usage();
  return 1;
}
