#include <gtest/gtest.h>
#include "../common/ByteBuffer.hpp"
#include "../common/Codec.hpp"
#include "../common/Messages.hpp"
#include "../common/protocol.hpp"

namespace net_survey::common::messages {

using Bytes = std::vector<uint8_t>;

namespace {

engine::ScanJobStatus SampleSweepStatus() {
    engine::ScanJobStatus status;
    status.job_id = "3f2a";
    status.range = "192.168.1.0/24";
    status.status = engine::ScanStatus::Scanning;
    status.progress = 42.52;
    status.scanned = 108;
    status.total = 254;
    status.found = 1;

    engine::DiscoveredDevice d;
    d.address = "192.168.1.20";
    d.liveness = engine::Liveness::Online;
    d.latency_ms = 0.73;
    d.packet_loss = 25.0;
    d.hostname = "printer-3f";
    d.mac = "3C:D9:2B:01:02:03";
    d.vendor = "Hewlett Packard";
    d.open_ports.push_back({9100, true, "JetDirect"});

    engine::ClassificationResult c;
    c.type = engine::DeviceType::Printer;
    c.score = 40;
    c.confidence = engine::Confidence::Medium;
    c.evidence.push_back({"Port", "9100"});
    c.runner_ups.emplace_back(engine::DeviceType::Server, 5);
    d.classification = c;

    status.new_devices.push_back(d);
    return status;
}

}

TEST(MessagesTest, SweepStatusSurvivesTheWire) {
    engine::ScanJobStatus decoded;
    ASSERT_TRUE(DecodeSweepStatus(EncodeSweepStatus(SampleSweepStatus()), decoded));

    EXPECT_EQ(decoded.job_id, "3f2a");
    EXPECT_DOUBLE_EQ(decoded.progress, 42.52);
    EXPECT_EQ(decoded.total, 254u);
    EXPECT_FALSE(decoded.error.has_value());
    ASSERT_EQ(decoded.new_devices.size(), 1u);

    const auto &d = decoded.new_devices[0];
    EXPECT_EQ(d.liveness, engine::Liveness::Online);
    EXPECT_EQ(d.latency_ms, std::optional<double>(0.73));
    EXPECT_EQ(d.mac, std::optional<std::string>("3C:D9:2B:01:02:03"));
    ASSERT_EQ(d.open_ports.size(), 1u);
    EXPECT_EQ(d.open_ports[0].port, 9100);
    ASSERT_TRUE(d.classification.has_value());
    EXPECT_EQ(d.classification->type, engine::DeviceType::Printer);
    ASSERT_EQ(d.classification->runner_ups.size(), 1u);
    EXPECT_EQ(d.classification->runner_ups[0].first, engine::DeviceType::Server);
    EXPECT_FALSE(d.agent.has_value());
}

TEST(MessagesTest, EveryTruncationIsRejected) {
    Bytes full = EncodeSweepStatus(SampleSweepStatus());
    for (std::size_t len = 0; len < full.size(); ++len) {
        engine::ScanJobStatus out;
        EXPECT_FALSE(DecodeSweepStatus(Bytes(full.begin(), full.begin() + len), out)) << "length " << len;
    }
}

TEST(MessagesTest, TrailingBytesAreRejected) {
    Bytes payload = EncodeText("job-1");
    payload.push_back(0x00);
    std::string out;
    EXPECT_FALSE(DecodeText(payload, out));

    Bytes flag = EncodeFlag(true);
    flag.push_back(0x01);
    bool b = false;
    EXPECT_FALSE(DecodeFlag(flag, b));
}

TEST(MessagesTest, OutOfRangeEnumsAreRejected) {
    engine::ClassificationResult result;
    result.type = engine::DeviceType::Switch;
    Bytes payload = EncodeClassification(result);
    payload[0] = 0x7F;

    engine::ClassificationResult out;
    EXPECT_FALSE(DecodeClassification(payload, out));
}

TEST(MessagesTest, ImpossibleCountsAreRejected) {
    Bytes payload;
    wire::append_u32_be(payload, 0xFFFFFFFFu);
    std::vector<engine::DiscoveredDevice> devices;
    EXPECT_FALSE(DecodeDevices(payload, devices));
}

TEST(MessagesTest, PortsAboveSixteenBitsAreRejected) {
    engine::ClassificationSignals signals;
    signals.address = "10.0.0.1";
    Bytes payload;
    wire::append_string(payload, signals.address);
    wire::append_string(payload, "");
    wire::append_string(payload, "");
    wire::append_string(payload, "");
    wire::append_u32_be(payload, 1);
    wire::append_u32_be(payload, 70000);
    wire::append_bool(payload, false);

    engine::ClassificationSignals out;
    EXPECT_FALSE(DecodeSignals(payload, out));
}

TEST(MessagesTest, TopologyStartCarriesWalkOptions) {
    TopologyStartRequest req;
    req.seed = "10.0.0.1";
    req.owner = "netops";
    req.options.max_depth = 2;
    req.options.max_switches = 10;
    req.options.credentials.community = "private";
    req.options.credentials.version = "1";
    req.options.persist = false;

    TopologyStartRequest out;
    ASSERT_TRUE(DecodeTopologyStart(EncodeTopologyStart(req), out));
    EXPECT_EQ(out.seed, "10.0.0.1");
    EXPECT_EQ(out.owner, "netops");
    EXPECT_EQ(out.options.max_depth, 2);
    EXPECT_EQ(out.options.max_switches, 10);
    EXPECT_EQ(out.options.credentials.community, "private");
    EXPECT_EQ(out.options.credentials.version, "1");
    EXPECT_FALSE(out.options.persist);
}

TEST(MessagesTest, TopologyStatusKeepsSwitchDetail) {
    engine::TopologyJobStatus status;
    status.job_id = "walk-1";
    status.seed = "10.0.0.1";
    status.status = engine::WalkStatus::Completed;
    status.switch_count = 1;
    status.device_count = 1;
    status.started = std::chrono::system_clock::time_point(std::chrono::seconds(1700000000));
    status.finished = std::chrono::system_clock::time_point(std::chrono::seconds(1700000042));
    status.persisted = engine::PersistCounts{1, 0};

    engine::TopologyWalkResult sw;
    sw.switch_address = "10.0.0.1";
    sw.sys_name = "core";
    engine::Neighbor n;
    n.device_id = "dist-a";
    n.address = "10.0.0.2";
    n.local_if_index = 3;
    n.capabilities = 0x08;
    n.is_switch = true;
    n.protocol = "CDP";
    sw.neighbors.push_back(n);
    sw.end_hosts.push_back({"00:11:22:33:44:55", std::string("10.0.0.77"), 7, 7, "Gi0/7"});
    sw.errors.push_back("LLDP error: timeout");
    status.switches.push_back(sw);

    engine::TopologyJobStatus out;
    ASSERT_TRUE(DecodeTopologyStatus(EncodeTopologyStatus(status), out));
    EXPECT_EQ(out.status, engine::WalkStatus::Completed);
    ASSERT_TRUE(out.finished.has_value());
    EXPECT_EQ(*out.finished - out.started, std::chrono::seconds(42));
    ASSERT_TRUE(out.persisted.has_value());
    EXPECT_EQ(out.persisted->inserted, 1);
    ASSERT_EQ(out.switches.size(), 1u);
    ASSERT_EQ(out.switches[0].neighbors.size(), 1u);
    EXPECT_EQ(out.switches[0].neighbors[0].capabilities, std::optional<uint32_t>(0x08));
    EXPECT_TRUE(out.switches[0].neighbors[0].is_switch);
    ASSERT_EQ(out.switches[0].end_hosts.size(), 1u);
    EXPECT_EQ(out.switches[0].end_hosts[0].port_name, "Gi0/7");
    EXPECT_EQ(out.switches[0].errors, std::vector<std::string>{"LLDP error: timeout"});
}

TEST(FrameTest, HeaderIsBigEndianWithMagic) {
    Bytes frame = protocol::Frame(protocol::MessageType::SweepPollReq, {0xAA, 0xBB});
    ASSERT_EQ(frame.size(), protocol::HEADER_SIZE + 2);
    EXPECT_EQ(frame[0], 0xBB);
    EXPECT_EQ(frame[1], 0xBB);
    EXPECT_EQ(frame[2], 0x12);
    EXPECT_EQ(frame[6], 0x02);

    auto hdr = protocol::DeserializeHeader(frame.data());
    EXPECT_EQ(hdr.magic, protocol::EXPECTED_MAGIC);
    EXPECT_EQ(hdr.payload_length, 2u);
    EXPECT_EQ(frame[8], 0xAA);
}

TEST(ByteBufferTest, FragmentedFrameIsReassembled) {
    Bytes frame = protocol::Frame(protocol::MessageType::ClassifyReq, {1, 2, 3, 4});
    ByteBuffer buffer;

    buffer.Append(frame.data(), 5);
    EXPECT_FALSE(buffer.HasHeader());

    buffer.Append(frame.data() + 5, 5);
    ASSERT_TRUE(buffer.HasHeader());
    EXPECT_TRUE(buffer.HasValidMagic());
    auto hdr = buffer.PeekHeader();
    EXPECT_EQ(hdr.msg_type, static_cast<uint8_t>(protocol::MessageType::ClassifyReq));
    EXPECT_FALSE(buffer.HasCompleteMessage(hdr));

    buffer.Append(frame.data() + 10, frame.size() - 10);
    ASSERT_TRUE(buffer.HasCompleteMessage(hdr));
    EXPECT_EQ(buffer.ExtractPayload(hdr.payload_length), (Bytes{1, 2, 3, 4}));

    buffer.Consume(protocol::HEADER_SIZE + hdr.payload_length);
    EXPECT_EQ(buffer.Size(), 0u);
}

TEST(ByteBufferTest, BadMagicAndOversizedFramesAreDetected) {
    Bytes garbage(protocol::HEADER_SIZE, 0x00);
    ByteBuffer buffer;
    buffer.Append(garbage.data(), garbage.size());
    EXPECT_FALSE(buffer.HasValidMagic());

    auto hdr = protocol::MakeHeader(protocol::MessageType::SweepStartReq, protocol::MAX_PAYLOAD_LENGTH + 1);
    EXPECT_TRUE(buffer.IsOversized(hdr));
    EXPECT_FALSE(buffer.HasCompleteMessage(hdr));

    buffer.Clear();
    EXPECT_THROW(buffer.PeekHeader(), std::runtime_error);
    EXPECT_THROW(buffer.ExtractPayload(1), std::runtime_error);
}

}
