#include <grpcpp/create_channel.h>
#include <grpcpp/security/credentials.h>

#include <iostream>
#include <memory>
#include <string>

#include "refiner/v1.hpp"

namespace {

refiner::v1::RawThreat MakeThreat(const std::string& id, const std::string& component, const std::string& stride, const std::string& description,
                                  const std::string& mitigation) {
  refiner::v1::RawThreat threat;
  threat.set_id(id);
  threat.set_component_name(component);
  threat.set_stride_category(stride);
  threat.set_threat_description(description);
  threat.set_mitigation_suggestion(mitigation);
  threat.set_impact("High");
  threat.set_likelihood("Medium");
  return threat;
}

} // namespace

int main(int argc, char** argv) {
  // Endpoint can be passed on the command line for non-default deployments.
  const std::string target = argc > 1 ? argv[1] : "localhost:50061";

  auto stub = refiner::v1::RefinementService::NewStub(grpc::CreateChannel(target, grpc::InsecureChannelCredentials()));

  refiner::v1::RefineThreatsRequest request;
  request.set_industry("Finance");

  auto* api = request.add_components();
  api->set_name("Payment API");
  api->set_type("Process");
  api->set_data_classification("PCI");

  auto* db = request.add_components();
  db->set_name("Ledger Database");
  db->set_type("Datastore");
  db->set_data_classification("Confidential");

  // Two near-identical findings on the same component collapse into one cluster.
  *request.add_threats() = MakeThreat("T-1", "Payment API", "Tampering",
                                      "An attacker intercepts payment requests in transit and modifies the transfer amount before the "
                                      "request reaches the payment API because request bodies are not integrity protected.",
                                      "Sign request bodies with an HMAC and verify the signature server side.");
  *request.add_threats() = MakeThreat("T-2", "Data Flow from Payment API", "Tampering",
                                      "An attacker intercepts payment requests in transit and modifies the transfer amount before the "
                                      "request reaches the payment service because request bodies are not integrity protected.",
                                      "Enforce mutual TLS between clients and the payment API.");
  *request.add_threats() = MakeThreat("T-3", "Ledger Database", "Information Disclosure",
                                      "Database backups of the ledger are written to shared storage without encryption, exposing "
                                      "account balances to anyone with read access to the storage bucket.",
                                      "Encrypt backups with a managed key and restrict bucket access to the backup role.");

  grpc::ClientContext                ctx;
  refiner::v1::RefineThreatsResponse response;
  auto                               status = stub->RefineThreats(&ctx, request, &response);
  if (!status.ok()) {
    std::cerr << "RefineThreats failed: " << status.error_message() << '\n';
    return 1;
  }

  for (const auto& threat : response.threats()) {
    if (threat.status() != refiner::v1::THREAT_STATUS_ACTIVE) continue;
    std::cout << threat.id() << " [" << threat.risk().severity_band() << " " << threat.risk().residual_risk() << "] " << threat.canonical_component()
              << '\n'
              << "  " << threat.risk().risk_statement() << '\n';
  }

  const auto& stats = response.statistics();
  std::cout << "original=" << stats.original_count() << " final=" << stats.final_count() << " merged=" << stats.merged_count()
            << " clusters=" << stats.cluster_count() << '\n';
  for (const auto& warning : response.warnings()) {
    std::cout << "warning: " << warning << '\n';
  }
  return 0;
}
