#pragma once

#include "../engine/ScanJobManager.hpp"
#include "../engine/TopologyJobManager.hpp"
#include "../engine/Types.hpp"

#include <cstdint>
#include <optional>
#include <string>
#include <vector>

// Payload layouts for every control-channel message. Encoders never fail;
// decoders return false on truncated or malformed input and leave no
// partial guarantees about the output.
namespace net_survey::common::messages
{
    struct SweepStartRequest
    {
        std::string range;
        std::string owner;
    };

    struct TopologyStartRequest
    {
        std::string seed;
        engine::WalkOptions options;
        std::string owner;
    };

    std::vector<uint8_t> EncodeSweepStart(const SweepStartRequest &req);
    bool DecodeSweepStart(const std::vector<uint8_t> &in, SweepStartRequest &out);

    std::vector<uint8_t> EncodeTopologyStart(const TopologyStartRequest &req);
    bool DecodeTopologyStart(const std::vector<uint8_t> &in, TopologyStartRequest &out);

    // Job ids, owners and error messages travel as a single string.
    std::vector<uint8_t> EncodeText(const std::string &text);
    bool DecodeText(const std::vector<uint8_t> &in, std::string &out);

    std::vector<uint8_t> EncodeOptionalText(const std::optional<std::string> &text);
    bool DecodeOptionalText(const std::vector<uint8_t> &in, std::optional<std::string> &out);

    std::vector<uint8_t> EncodeFlag(bool flag);
    bool DecodeFlag(const std::vector<uint8_t> &in, bool &out);

    std::vector<uint8_t> EncodeSweepStatus(const engine::ScanJobStatus &status);
    bool DecodeSweepStatus(const std::vector<uint8_t> &in, engine::ScanJobStatus &out);

    std::vector<uint8_t> EncodeDevices(const std::vector<engine::DiscoveredDevice> &devices);
    bool DecodeDevices(const std::vector<uint8_t> &in, std::vector<engine::DiscoveredDevice> &out);

    std::vector<uint8_t> EncodeTopologyStatus(const engine::TopologyJobStatus &status);
    bool DecodeTopologyStatus(const std::vector<uint8_t> &in, engine::TopologyJobStatus &out);

    std::vector<uint8_t> EncodeSignals(const engine::ClassificationSignals &signals);
    bool DecodeSignals(const std::vector<uint8_t> &in, engine::ClassificationSignals &out);

    std::vector<uint8_t> EncodeClassification(const engine::ClassificationResult &result);
    bool DecodeClassification(const std::vector<uint8_t> &in, engine::ClassificationResult &out);
}
