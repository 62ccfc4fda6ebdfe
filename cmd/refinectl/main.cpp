#include <google/protobuf/util/json_util.h>
#include <grpcpp/grpcpp.h>

#include <fstream>
#include <iostream>
#include <memory>
#include <sstream>
#include <string>

#include "internal/config/config_loader.hpp"
#include "internal/factory.hpp"
#include "internal/observability/logging.hpp"
#include "internal/service/refinement_service.hpp"
#include "refiner/v1.hpp"

using namespace refiner::v1;

static void Usage() {
  std::cout << "Usage:\n"
            << "  refinectl local <request.json> [config.yaml]\n"
            << "  refinectl <addr> refine <request.json>\n";
}

static bool ReadRequest(const std::string& path, RefineThreatsRequest* req) {
  std::ifstream in(path);
  if (!in) {
    std::cerr << "cannot open request file: " << path << "\n";
    return false;
  }

  std::stringstream buffer;
  buffer << in.rdbuf();

  google::protobuf::util::JsonParseOptions options;
  options.ignore_unknown_fields = false;

  auto status = google::protobuf::util::JsonStringToMessage(buffer.str(), req, options);
  if (!status.ok()) {
    std::cerr << "invalid request " << path << ": " << status.message() << "\n";
    return false;
  }
  return true;
}

static int PrintResponse(const RefineThreatsResponse& resp) {
  google::protobuf::util::JsonPrintOptions options;
  options.add_whitespace             = true;
  options.preserve_proto_field_names = true;

  std::string json;
  auto        status = google::protobuf::util::MessageToJsonString(resp, &json, options);
  if (!status.ok()) {
    std::cerr << "cannot encode response: " << status.message() << "\n";
    return 2;
  }

  std::cout << json << "\n";
  return 0;
}

// ------------------------------------------------------------
// In-process run
// ------------------------------------------------------------
static int RunLocal(const std::string& request_path, const std::string& config_path) {
  RefineThreatsRequest req;
  if (!ReadRequest(request_path, &req)) return 1;

  try {
    refiner::runtime::config::RuntimeConfig config;
    if (!config_path.empty()) {
      config = refiner::config::ConfigLoader::LoadFromYaml(config_path);
      refiner::observability::InitializeLogging(config);
    } else {
      refiner::observability::InitializeDefaultLogging();
    }

    auto app  = refiner::factory::Build(config);
    auto resp = app.refinement_service->RefineThreats(req);
    return PrintResponse(resp);
  } catch (const std::exception& e) {
    std::cerr << e.what() << "\n";
    return 2;
  }
}

// ------------------------------------------------------------
// Remote run
// ------------------------------------------------------------
static int RunRemote(const std::string& addr, const std::string& request_path) {
  RefineThreatsRequest req;
  if (!ReadRequest(request_path, &req)) return 1;

  auto channel = grpc::CreateChannel(addr, grpc::InsecureChannelCredentials());
  auto stub    = RefinementService::NewStub(channel);

  grpc::ClientContext   ctx;
  RefineThreatsResponse resp;
  auto                  status = stub->RefineThreats(&ctx, req, &resp);
  if (!status.ok()) {
    std::cerr << status.error_message() << "\n";
    return 2;
  }
  return PrintResponse(resp);
}

int main(int argc, char** argv) {
  if (argc < 3) {
    Usage();
    return 1;
  }

  std::string first = argv[1];

  if (first == "local") {
    return RunLocal(argv[2], argc >= 4 ? argv[3] : "");
  }

  std::string cmd = argv[2];
  if (cmd == "refine" && argc >= 4) {
    return RunRemote(first, argv[3]);
  }

  Usage();
  return 1;
}
