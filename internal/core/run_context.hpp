#pragma once

#include <string>
#include <vector>

#include "internal/model/component.hpp"
#include "internal/model/control.hpp"
#include "internal/model/industry.hpp"
#include "internal/util/time.hpp"
#include "internal/vuln/vulnerability_catalog.hpp"

namespace refiner::core {

/*
  Side inputs of one run. Built before the first stage and read-only
  afterwards; the vulnerability snapshot is resolved once per run and
  never consulted outside it.
*/
struct RunContext {
  util::Date      as_of{};
  model::Industry industry = model::Industry::kGeneric;

  std::vector<model::Component> components;
  std::vector<model::Control>   controls;

  vuln::VulnerabilitySnapshot vulnerabilities;

  std::vector<std::string> warnings;
};

} // namespace refiner::core
