#pragma once

#include "Types.hpp"

#include <nlohmann/json.hpp>

namespace net_survey::engine
{
    // JSON renderings used for event payloads and the control client's
    // --json output.
    nlohmann::json ToJson(const ClassificationResult &result);
    nlohmann::json ToJson(const DiscoveredDevice &device);
    nlohmann::json ToJson(const TopologyWalkResult &result);
}
