#pragma once

#include <string>
#include <vector>

namespace refiner::model {

/*
  Ephemeral grouping of equivalent findings. Lives only for one run.
*/
struct Cluster {
  std::string              id;
  std::vector<std::string> member_threat_ids;
  std::string              representative_id;
};

} // namespace refiner::model
