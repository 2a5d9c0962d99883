#pragma once

#include "cs/core/params/CropParams.hpp"
#include "cs/core/types/VolumeShape.hpp"

#include <nlohmann/json_fwd.hpp>

namespace cs::params {

// Missing keys keep their defaults; malformed values throw std::runtime_error
RegionFilterParams parseRegionFilter(const nlohmann::json& j);
GridParams parseGridParams(const nlohmann::json& j);
FrontierParams parseFrontierParams(const nlohmann::json& j);
MixtureParams parseMixtureParams(const nlohmann::json& j);

nlohmann::json toJson(const RegionFilterParams& p);
nlohmann::json toJson(const GridParams& p);
nlohmann::json toJson(const FrontierParams& p);
nlohmann::json toJson(const MixtureParams& p);

// {"id": "...", "extent": [i, x, h], "empty_traces": [[i, x], ...]}
VolumeShape parseVolumeShape(const nlohmann::json& j);

}  // namespace cs::params
