#include "internal/refine/quality_gate.hpp"

#include <cassert>
#include <iostream>
#include <string>

namespace {

using refiner::config::QualityOptions;
using refiner::model::Threat;
using refiner::model::ThreatStatus;
using refiner::refine::QualityGate;

QualityOptions Enabled() {
  QualityOptions options;
  options.enabled = true;
  return options;
}

Threat MakeThreat(const std::string& description, const std::string& mitigation) {
  Threat threat;
  threat.id                    = "T-1";
  threat.component_ref         = "Payment API";
  threat.description           = description;
  threat.mitigation_suggestion = mitigation;
  return threat;
}

const std::string kSpecific =
    "Refund callbacks from the card processor carry no timestamp, so a captured callback can be replayed to credit an account twice.";
const std::string kMitigation = "Add a signed timestamp and nonce to callbacks and reject replays older than five minutes.";

void TestSpecificThreatPasses() {
  QualityGate gate(Enabled());
  auto        threat = MakeThreat(kSpecific, kMitigation);

  assert(!gate.Evaluate(threat).has_value());
  assert(!gate.Apply(threat));
  assert(threat.status == ThreatStatus::kActive);
}

void TestShortDescriptionIsSuppressed() {
  QualityGate gate(Enabled());
  auto        threat = MakeThreat("Data could leak.", kMitigation);

  assert(gate.Apply(threat));
  assert(threat.status == ThreatStatus::kSuppressed);
  assert(*threat.suppressed_reason == "low_quality");
}

void TestGenericPhrasesAreCounted() {
  QualityGate gate(Enabled());

  auto two = MakeThreat("An attacker could gain unauthorized access to the refund ledger through the admin console.", kMitigation);
  assert(!gate.Evaluate(two).has_value());

  auto three = MakeThreat(
      "An attacker could gain unauthorized access because a vulnerability may exist somewhere in the payment flow.", kMitigation);
  auto reason = gate.Evaluate(three);
  assert(reason.has_value());
  assert(reason->find("3 generic phrases") != std::string::npos);
}

void TestPlaceholderMitigationIsSuppressed() {
  QualityGate gate(Enabled());

  auto placeholder = MakeThreat(kSpecific, "Implement security measures across the payment API.");
  assert(gate.Apply(placeholder));

  auto short_mitigation = MakeThreat(kSpecific, "Use TLS.");
  assert(gate.Evaluate(short_mitigation).has_value());
}

void TestDisabledGateNeverSuppresses() {
  QualityGate gate(QualityOptions{});
  auto        threat = MakeThreat("Too short.", "n/a");

  assert(gate.Evaluate(threat).has_value());
  assert(!gate.Apply(threat));
  assert(threat.status == ThreatStatus::kActive);
}

} // namespace

int main() {
  TestSpecificThreatPasses();
  TestShortDescriptionIsSuppressed();
  TestGenericPhrasesAreCounted();
  TestPlaceholderMitigationIsSuppressed();
  TestDisabledGateNeverSuppresses();

  std::cout << "threat_refiner_unit_quality_gate: pass\n";
  return 0;
}
