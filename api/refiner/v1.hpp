#pragma once

#include "refiner/v1/threat.pb.h"
#include "refiner/v1/refinement_service.pb.h"
#include "refiner/v1/refinement_service.grpc.pb.h"

#include "refiner/feed/v1/feed.pb.h"
