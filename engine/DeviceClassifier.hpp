#pragma once

#include "Types.hpp"

namespace net_survey::engine
{
    inline constexpr int WEIGHT_BANNER = 60;
    inline constexpr int WEIGHT_VENDOR = 25;
    inline constexpr int WEIGHT_PORT = 15;
    inline constexpr int WEIGHT_HOSTNAME = 10;

    inline constexpr int THRESHOLD_HIGH = 50;
    inline constexpr int THRESHOLD_MEDIUM = 25;
    inline constexpr int SCORE_FLOOR = 10;

    // Weighted multi-signal scorer. Four evidence families each add a fixed
    // weight to every device type they match:
    //
    //   banner (SNMP sysDescr) 60, vendor 25, open ports 15, hostname 10.
    //
    // Equal scores are ordered by the DeviceType declaration order, so
    // infrastructure types rank ahead of endpoints. Classify() is pure and
    // never throws for well-formed input.
    class DeviceClassifier
    {
    public:
        ClassificationResult Classify(const ClassificationSignals &signals) const;
    };
}
