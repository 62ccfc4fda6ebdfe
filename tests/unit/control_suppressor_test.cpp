#include "internal/refine/control_suppressor.hpp"

#include <cassert>
#include <iostream>
#include <set>
#include <string>
#include <vector>

#include "internal/refine/transitions.hpp"
#include "internal/util/errors.hpp"

namespace {

using refiner::model::Control;
using refiner::model::StrideCategory;
using refiner::model::Threat;
using refiner::model::ThreatStatus;
using refiner::refine::ControlSuppressor;

Control MakeControl(const std::string& name, std::initializer_list<StrideCategory> coverage, std::vector<std::string> applies_to) {
  Control control;
  control.name = name;
  for (auto category : coverage) control.coverage.Insert(category);
  control.applies_to = std::move(applies_to);
  return control;
}

Threat MakeThreat(const std::string& id, const std::string& component, StrideCategory category, bool matched = true) {
  Threat threat;
  threat.id              = id;
  threat.component_ref   = component;
  threat.stride_category = category;
  if (matched) {
    threat.canonical_component = component;
  } else {
    threat.unmatched_component = true;
  }
  return threat;
}

void TestComponentControlSuppressesMatchingCategory() {
  std::vector<Control> controls = {MakeControl("Request Signing", {StrideCategory::kTampering}, {"Payment API"})};
  ControlSuppressor    suppressor(controls, true);

  auto covered = MakeThreat("T-1", "Payment API", StrideCategory::kTampering);
  auto other   = MakeThreat("T-2", "Ledger Database", StrideCategory::kTampering);

  assert(suppressor.Apply(covered));
  assert(covered.status == ThreatStatus::kSuppressed);
  assert(covered.suppressed_reason && *covered.suppressed_reason == "control:Request Signing");

  assert(!suppressor.Apply(other));
  assert(other.status == ThreatStatus::kActive);
  assert(!other.suppressed_reason.has_value());
}

void TestGlobalSpoofingControlLeavesTamperingUntouched() {
  std::vector<Control> controls = {MakeControl("SSO with MFA", {StrideCategory::kSpoofing}, {"global"})};
  ControlSuppressor    suppressor(controls, true);

  std::vector<Threat> threats = {
      MakeThreat("T-1", "Payment API", StrideCategory::kSpoofing),
      MakeThreat("T-2", "Ledger Database", StrideCategory::kSpoofing),
      MakeThreat("T-3", "Payment API", StrideCategory::kTampering),
  };
  for (auto& threat : threats) suppressor.Apply(threat);

  assert(threats[0].status == ThreatStatus::kSuppressed);
  assert(threats[1].status == ThreatStatus::kSuppressed);
  assert(*threats[1].suppressed_reason == "control:SSO with MFA");
  assert(threats[2].status == ThreatStatus::kActive);
}

void TestFirstCoveringControlIsRecorded() {
  std::vector<Control> controls = {
      MakeControl("Rate Limiting", {StrideCategory::kDenialOfService}, {"Payment API"}),
      MakeControl("WAF", {StrideCategory::kTampering, StrideCategory::kDenialOfService}, {"global"}),
      MakeControl("Request Signing", {StrideCategory::kTampering}, {"Payment API"}),
  };
  ControlSuppressor suppressor(controls, true);

  auto threat = MakeThreat("T-1", "Payment API", StrideCategory::kTampering);
  suppressor.Apply(threat);
  assert(*threat.suppressed_reason == "control:WAF");
}

void TestUnmatchedThreatsAreNeverSuppressed() {
  std::vector<Control> controls = {MakeControl("SSO", {StrideCategory::kSpoofing}, {"global"})};
  ControlSuppressor    suppressor(controls, true);

  auto threat = MakeThreat("T-1", "Mainframe", StrideCategory::kSpoofing, false);
  assert(suppressor.FindCoveringControl(threat) == nullptr);
  assert(!suppressor.Apply(threat));
  assert(threat.status == ThreatStatus::kActive);
}

void TestReportOnlyModeLeavesStatusAlone() {
  std::vector<Control> controls = {MakeControl("SSO", {StrideCategory::kSpoofing}, {"global"})};
  ControlSuppressor    suppressor(controls, false);

  auto threat = MakeThreat("T-1", "Payment API", StrideCategory::kSpoofing);
  assert(suppressor.FindCoveringControl(threat) == &controls[0]);
  assert(!suppressor.Apply(threat));
  assert(threat.status == ThreatStatus::kActive);
}

void TestAddingControlsOnlyGrowsSuppressedSet() {
  std::vector<Threat> base = {
      MakeThreat("T-1", "Payment API", StrideCategory::kSpoofing),
      MakeThreat("T-2", "Payment API", StrideCategory::kTampering),
      MakeThreat("T-3", "Ledger Database", StrideCategory::kInformationDisclosure),
      MakeThreat("T-4", "Ledger Database", StrideCategory::kTampering),
  };

  std::vector<Control> few  = {MakeControl("Signing", {StrideCategory::kTampering}, {"Payment API"})};
  std::vector<Control> more = few;
  more.push_back(MakeControl("Encryption", {StrideCategory::kInformationDisclosure, StrideCategory::kTampering}, {"Ledger Database"}));

  auto suppressed_ids = [&base](const std::vector<Control>& controls) {
    ControlSuppressor     suppressor(controls, true);
    std::set<std::string> ids;
    auto                  threats = base;
    for (auto& threat : threats) {
      if (suppressor.Apply(threat)) ids.insert(threat.id);
    }
    return ids;
  };

  const auto with_few  = suppressed_ids(few);
  const auto with_more = suppressed_ids(more);
  assert(with_few.size() == 1);
  assert(with_more.size() == 3);
  for (const auto& id : with_few) assert(with_more.count(id) == 1);
}

void TestAlreadyMergedThreatIsSkipped() {
  std::vector<Control> controls = {MakeControl("SSO", {StrideCategory::kSpoofing}, {"global"})};
  ControlSuppressor    suppressor(controls, true);

  auto threat   = MakeThreat("T-1", "Payment API", StrideCategory::kSpoofing);
  threat.status = ThreatStatus::kMerged;
  assert(!suppressor.Apply(threat));
  assert(threat.status == ThreatStatus::kMerged);
}

void TestSuppressingTwiceIsAnInvariantViolation() {
  auto threat = MakeThreat("T-1", "Payment API", StrideCategory::kSpoofing);
  refiner::refine::Suppress(threat, "stale_cve");

  bool threw = false;
  try {
    refiner::refine::Suppress(threat, "low_quality");
  } catch (const refiner::util::InvariantViolation&) {
    threw = true;
  }
  assert(threw);
  assert(*threat.suppressed_reason == "stale_cve");
}

} // namespace

int main() {
  TestComponentControlSuppressesMatchingCategory();
  TestGlobalSpoofingControlLeavesTamperingUntouched();
  TestFirstCoveringControlIsRecorded();
  TestUnmatchedThreatsAreNeverSuppressed();
  TestReportOnlyModeLeavesStatusAlone();
  TestAddingControlsOnlyGrowsSuppressedSet();
  TestAlreadyMergedThreatIsSkipped();
  TestSuppressingTwiceIsAnInvariantViolation();

  std::cout << "threat_refiner_unit_control_suppressor: pass\n";
  return 0;
}
