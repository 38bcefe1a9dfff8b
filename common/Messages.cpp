#include "Messages.hpp"
#include "Codec.hpp"

#include <chrono>

namespace net_survey::common::messages
{
    using namespace net_survey::common::wire;
    using Bytes = std::vector<uint8_t>;

    namespace
    {
        void append_i32(Bytes &out, int32_t value)
        {
            append_u32_be(out, static_cast<uint32_t>(value));
        }

        bool read_i32(const Bytes &in, std::size_t &offset, int32_t &value_out)
        {
            uint32_t raw = 0;
            if (!read_u32_be(in, offset, raw))
                return false;
            value_out = static_cast<int32_t>(raw);
            return true;
        }

        bool read_int(const Bytes &in, std::size_t &offset, int &value_out)
        {
            int32_t v = 0;
            if (!read_i32(in, offset, v))
                return false;
            value_out = v;
            return true;
        }

        template <typename E>
        void append_enum(Bytes &out, E value)
        {
            append_u8(out, static_cast<uint8_t>(value));
        }

        template <typename E>
        bool read_enum(const Bytes &in, std::size_t &offset, E last, E &value_out)
        {
            uint8_t raw = 0;
            if (!read_u8(in, offset, raw) || raw > static_cast<uint8_t>(last))
                return false;
            value_out = static_cast<E>(raw);
            return true;
        }

        void append_opt_string(Bytes &out, const std::optional<std::string> &value)
        {
            append_bool(out, value.has_value());
            if (value)
                append_string(out, *value);
        }

        bool read_opt_string(const Bytes &in, std::size_t &offset, std::optional<std::string> &value_out)
        {
            bool present = false;
            if (!read_bool(in, offset, present))
                return false;
            value_out.reset();
            if (!present)
                return true;
            std::string s;
            if (!read_string(in, offset, s))
                return false;
            value_out = std::move(s);
            return true;
        }

        void append_opt_int(Bytes &out, const std::optional<int> &value)
        {
            append_bool(out, value.has_value());
            if (value)
                append_i32(out, *value);
        }

        bool read_opt_int(const Bytes &in, std::size_t &offset, std::optional<int> &value_out)
        {
            bool present = false;
            if (!read_bool(in, offset, present))
                return false;
            value_out.reset();
            if (!present)
                return true;
            int v = 0;
            if (!read_int(in, offset, v))
                return false;
            value_out = v;
            return true;
        }

        // Counts are bounded by what is left in the buffer so a corrupt
        // length cannot trigger a huge allocation.
        bool read_count(const Bytes &in, std::size_t &offset, uint32_t &count)
        {
            return read_u32_be(in, offset, count) && count <= in.size() - offset;
        }

        void append_strings(Bytes &out, const std::vector<std::string> &values)
        {
            append_u32_be(out, static_cast<uint32_t>(values.size()));
            for (const auto &v : values)
                append_string(out, v);
        }

        bool read_strings(const Bytes &in, std::size_t &offset, std::vector<std::string> &values)
        {
            uint32_t count = 0;
            if (!read_count(in, offset, count))
                return false;
            values.clear();
            for (uint32_t i = 0; i < count; ++i)
            {
                std::string s;
                if (!read_string(in, offset, s))
                    return false;
                values.push_back(std::move(s));
            }
            return true;
        }

        void append_classification(Bytes &out, const engine::ClassificationResult &r)
        {
            append_enum(out, r.type);
            append_i32(out, r.score);
            append_enum(out, r.confidence);
            append_u32_be(out, static_cast<uint32_t>(r.evidence.size()));
            for (const auto &e : r.evidence)
            {
                append_string(out, e.source);
                append_string(out, e.value);
            }
            append_u32_be(out, static_cast<uint32_t>(r.runner_ups.size()));
            for (const auto &ru : r.runner_ups)
            {
                append_enum(out, ru.first);
                append_i32(out, ru.second);
            }
        }

        bool read_classification(const Bytes &in, std::size_t &offset, engine::ClassificationResult &r)
        {
            uint32_t count = 0;
            if (!read_enum(in, offset, engine::DeviceType::Unknown, r.type) || !read_int(in, offset, r.score) ||
                !read_enum(in, offset, engine::Confidence::Low, r.confidence) || !read_count(in, offset, count))
                return false;

            r.evidence.clear();
            for (uint32_t i = 0; i < count; ++i)
            {
                engine::Evidence e;
                if (!read_string(in, offset, e.source) || !read_string(in, offset, e.value))
                    return false;
                r.evidence.push_back(std::move(e));
            }

            if (!read_count(in, offset, count))
                return false;
            r.runner_ups.clear();
            for (uint32_t i = 0; i < count; ++i)
            {
                engine::DeviceType type = engine::DeviceType::Unknown;
                int score = 0;
                if (!read_enum(in, offset, engine::DeviceType::Unknown, type) || !read_int(in, offset, score))
                    return false;
                r.runner_ups.emplace_back(type, score);
            }
            return true;
        }

        void append_opt_classification(Bytes &out, const std::optional<engine::ClassificationResult> &r)
        {
            append_bool(out, r.has_value());
            if (r)
                append_classification(out, *r);
        }

        bool read_opt_classification(const Bytes &in, std::size_t &offset,
                                     std::optional<engine::ClassificationResult> &r)
        {
            bool present = false;
            if (!read_bool(in, offset, present))
                return false;
            r.reset();
            if (!present)
                return true;
            engine::ClassificationResult value;
            if (!read_classification(in, offset, value))
                return false;
            r = std::move(value);
            return true;
        }

        void append_device(Bytes &out, const engine::DiscoveredDevice &d)
        {
            append_string(out, d.address);
            append_enum(out, d.liveness);
            append_bool(out, d.latency_ms.has_value());
            if (d.latency_ms)
                append_double(out, *d.latency_ms);
            append_double(out, d.packet_loss);
            append_string(out, d.hostname);
            append_opt_string(out, d.mac);
            append_string(out, d.vendor);

            append_u32_be(out, static_cast<uint32_t>(d.open_ports.size()));
            for (const auto &p : d.open_ports)
            {
                append_u32_be(out, p.port);
                append_bool(out, p.open);
                append_string(out, p.service);
            }

            append_opt_classification(out, d.classification);

            append_bool(out, d.agent.has_value());
            if (d.agent)
            {
                append_string(out, d.agent->hostname);
                append_string(out, d.agent->mac);
                append_string(out, d.agent->agent_version);
                append_string(out, d.agent->os);
            }
            append_string(out, d.error);
        }

        bool read_device(const Bytes &in, std::size_t &offset, engine::DiscoveredDevice &d)
        {
            bool has_latency = false;
            if (!read_string(in, offset, d.address) ||
                !read_enum(in, offset, engine::Liveness::Error, d.liveness) ||
                !read_bool(in, offset, has_latency))
                return false;

            d.latency_ms.reset();
            if (has_latency)
            {
                double latency = 0.0;
                if (!read_double(in, offset, latency))
                    return false;
                d.latency_ms = latency;
            }

            uint32_t port_count = 0;
            if (!read_double(in, offset, d.packet_loss) || !read_string(in, offset, d.hostname) ||
                !read_opt_string(in, offset, d.mac) || !read_string(in, offset, d.vendor) ||
                !read_count(in, offset, port_count))
                return false;

            d.open_ports.clear();
            for (uint32_t i = 0; i < port_count; ++i)
            {
                engine::PortResult p;
                uint32_t port = 0;
                if (!read_u32_be(in, offset, port) || port > 65535 || !read_bool(in, offset, p.open) ||
                    !read_string(in, offset, p.service))
                    return false;
                p.port = static_cast<uint16_t>(port);
                d.open_ports.push_back(std::move(p));
            }

            bool has_agent = false;
            if (!read_opt_classification(in, offset, d.classification) || !read_bool(in, offset, has_agent))
                return false;

            d.agent.reset();
            if (has_agent)
            {
                engine::AgentIdentity agent;
                if (!read_string(in, offset, agent.hostname) || !read_string(in, offset, agent.mac) ||
                    !read_string(in, offset, agent.agent_version) || !read_string(in, offset, agent.os))
                    return false;
                d.agent = std::move(agent);
            }
            return read_string(in, offset, d.error);
        }

        void append_devices(Bytes &out, const std::vector<engine::DiscoveredDevice> &devices)
        {
            append_u32_be(out, static_cast<uint32_t>(devices.size()));
            for (const auto &d : devices)
                append_device(out, d);
        }

        bool read_devices(const Bytes &in, std::size_t &offset, std::vector<engine::DiscoveredDevice> &devices)
        {
            uint32_t count = 0;
            if (!read_count(in, offset, count))
                return false;
            devices.clear();
            for (uint32_t i = 0; i < count; ++i)
            {
                engine::DiscoveredDevice d;
                if (!read_device(in, offset, d))
                    return false;
                devices.push_back(std::move(d));
            }
            return true;
        }

        void append_neighbor(Bytes &out, const engine::Neighbor &n)
        {
            append_string(out, n.device_id);
            append_opt_string(out, n.address);
            append_opt_int(out, n.local_if_index);
            append_string(out, n.local_port);
            append_string(out, n.remote_port);
            append_string(out, n.platform);
            append_bool(out, n.capabilities.has_value());
            if (n.capabilities)
                append_u32_be(out, *n.capabilities);
            append_bool(out, n.is_switch);
            append_string(out, n.protocol);
        }

        bool read_neighbor(const Bytes &in, std::size_t &offset, engine::Neighbor &n)
        {
            bool has_caps = false;
            if (!read_string(in, offset, n.device_id) || !read_opt_string(in, offset, n.address) ||
                !read_opt_int(in, offset, n.local_if_index) || !read_string(in, offset, n.local_port) ||
                !read_string(in, offset, n.remote_port) || !read_string(in, offset, n.platform) ||
                !read_bool(in, offset, has_caps))
                return false;

            n.capabilities.reset();
            if (has_caps)
            {
                uint32_t caps = 0;
                if (!read_u32_be(in, offset, caps))
                    return false;
                n.capabilities = caps;
            }
            return read_bool(in, offset, n.is_switch) && read_string(in, offset, n.protocol);
        }

        void append_end_host(Bytes &out, const engine::EndHost &h)
        {
            append_string(out, h.mac);
            append_opt_string(out, h.address);
            append_opt_int(out, h.bridge_port);
            append_opt_int(out, h.if_index);
            append_string(out, h.port_name);
        }

        bool read_end_host(const Bytes &in, std::size_t &offset, engine::EndHost &h)
        {
            return read_string(in, offset, h.mac) && read_opt_string(in, offset, h.address) &&
                   read_opt_int(in, offset, h.bridge_port) && read_opt_int(in, offset, h.if_index) &&
                   read_string(in, offset, h.port_name);
        }

        void append_switch(Bytes &out, const engine::TopologyWalkResult &sw)
        {
            append_string(out, sw.switch_address);
            append_i32(out, sw.depth);
            append_string(out, sw.sys_name);
            append_string(out, sw.sys_descr);
            append_opt_classification(out, sw.classification);

            append_u32_be(out, static_cast<uint32_t>(sw.neighbors.size()));
            for (const auto &n : sw.neighbors)
                append_neighbor(out, n);

            append_u32_be(out, static_cast<uint32_t>(sw.end_hosts.size()));
            for (const auto &h : sw.end_hosts)
                append_end_host(out, h);

            append_strings(out, sw.errors);
        }

        bool read_switch(const Bytes &in, std::size_t &offset, engine::TopologyWalkResult &sw)
        {
            uint32_t count = 0;
            if (!read_string(in, offset, sw.switch_address) || !read_int(in, offset, sw.depth) ||
                !read_string(in, offset, sw.sys_name) || !read_string(in, offset, sw.sys_descr) ||
                !read_opt_classification(in, offset, sw.classification) || !read_count(in, offset, count))
                return false;

            sw.neighbors.clear();
            for (uint32_t i = 0; i < count; ++i)
            {
                engine::Neighbor n;
                if (!read_neighbor(in, offset, n))
                    return false;
                sw.neighbors.push_back(std::move(n));
            }

            if (!read_count(in, offset, count))
                return false;
            sw.end_hosts.clear();
            for (uint32_t i = 0; i < count; ++i)
            {
                engine::EndHost h;
                if (!read_end_host(in, offset, h))
                    return false;
                sw.end_hosts.push_back(std::move(h));
            }

            return read_strings(in, offset, sw.errors);
        }

        void append_credentials(Bytes &out, const engine::SnmpCredentials &c)
        {
            append_string(out, c.community);
            append_string(out, c.version);
            append_u32_be(out, c.port);
            append_i32(out, c.timeout_ms);
            append_i32(out, c.retries);
        }

        bool read_credentials(const Bytes &in, std::size_t &offset, engine::SnmpCredentials &c)
        {
            uint32_t port = 0;
            if (!read_string(in, offset, c.community) || !read_string(in, offset, c.version) ||
                !read_u32_be(in, offset, port) || port > 65535 || !read_int(in, offset, c.timeout_ms) ||
                !read_int(in, offset, c.retries))
                return false;
            c.port = static_cast<uint16_t>(port);
            return true;
        }

        void append_walk_options(Bytes &out, const engine::WalkOptions &o)
        {
            append_i32(out, o.max_depth);
            append_i32(out, o.max_switches);
            append_credentials(out, o.credentials);
            append_bool(out, o.persist);
        }

        bool read_walk_options(const Bytes &in, std::size_t &offset, engine::WalkOptions &o)
        {
            return read_int(in, offset, o.max_depth) && read_int(in, offset, o.max_switches) &&
                   read_credentials(in, offset, o.credentials) && read_bool(in, offset, o.persist);
        }

        int64_t ToEpochSeconds(std::chrono::system_clock::time_point tp)
        {
            return std::chrono::duration_cast<std::chrono::seconds>(tp.time_since_epoch()).count();
        }

        void append_time(Bytes &out, std::chrono::system_clock::time_point tp)
        {
            append_double(out, static_cast<double>(ToEpochSeconds(tp)));
        }

        bool read_time(const Bytes &in, std::size_t &offset, std::chrono::system_clock::time_point &tp)
        {
            double seconds = 0.0;
            if (!read_double(in, offset, seconds))
                return false;
            tp = std::chrono::system_clock::time_point(std::chrono::seconds(static_cast<int64_t>(seconds)));
            return true;
        }

        bool Finished(const Bytes &in, std::size_t offset)
        {
            return offset == in.size();
        }
    }

    Bytes EncodeSweepStart(const SweepStartRequest &req)
    {
        Bytes out;
        append_string(out, req.range);
        append_string(out, req.owner);
        return out;
    }

    bool DecodeSweepStart(const Bytes &in, SweepStartRequest &out)
    {
        std::size_t offset = 0;
        return read_string(in, offset, out.range) && read_string(in, offset, out.owner) && Finished(in, offset);
    }

    Bytes EncodeTopologyStart(const TopologyStartRequest &req)
    {
        Bytes out;
        append_string(out, req.seed);
        append_walk_options(out, req.options);
        append_string(out, req.owner);
        return out;
    }

    bool DecodeTopologyStart(const Bytes &in, TopologyStartRequest &out)
    {
        std::size_t offset = 0;
        return read_string(in, offset, out.seed) && read_walk_options(in, offset, out.options) &&
               read_string(in, offset, out.owner) && Finished(in, offset);
    }

    Bytes EncodeText(const std::string &text)
    {
        Bytes out;
        append_string(out, text);
        return out;
    }

    bool DecodeText(const Bytes &in, std::string &out)
    {
        std::size_t offset = 0;
        return read_string(in, offset, out) && Finished(in, offset);
    }

    Bytes EncodeOptionalText(const std::optional<std::string> &text)
    {
        Bytes out;
        append_opt_string(out, text);
        return out;
    }

    bool DecodeOptionalText(const Bytes &in, std::optional<std::string> &out)
    {
        std::size_t offset = 0;
        return read_opt_string(in, offset, out) && Finished(in, offset);
    }

    Bytes EncodeFlag(bool flag)
    {
        Bytes out;
        append_bool(out, flag);
        return out;
    }

    bool DecodeFlag(const Bytes &in, bool &out)
    {
        std::size_t offset = 0;
        return read_bool(in, offset, out) && Finished(in, offset);
    }

    Bytes EncodeSweepStatus(const engine::ScanJobStatus &status)
    {
        Bytes out;
        append_string(out, status.job_id);
        append_string(out, status.range);
        append_enum(out, status.status);
        append_double(out, status.progress);
        append_u32_be(out, status.scanned);
        append_u32_be(out, status.total);
        append_u32_be(out, status.found);
        append_devices(out, status.new_devices);
        append_opt_string(out, status.error);
        return out;
    }

    bool DecodeSweepStatus(const Bytes &in, engine::ScanJobStatus &out)
    {
        std::size_t offset = 0;
        return read_string(in, offset, out.job_id) && read_string(in, offset, out.range) &&
               read_enum(in, offset, engine::ScanStatus::Error, out.status) &&
               read_double(in, offset, out.progress) && read_u32_be(in, offset, out.scanned) &&
               read_u32_be(in, offset, out.total) && read_u32_be(in, offset, out.found) &&
               read_devices(in, offset, out.new_devices) && read_opt_string(in, offset, out.error) &&
               Finished(in, offset);
    }

    Bytes EncodeDevices(const std::vector<engine::DiscoveredDevice> &devices)
    {
        Bytes out;
        append_devices(out, devices);
        return out;
    }

    bool DecodeDevices(const Bytes &in, std::vector<engine::DiscoveredDevice> &out)
    {
        std::size_t offset = 0;
        return read_devices(in, offset, out) && Finished(in, offset);
    }

    Bytes EncodeTopologyStatus(const engine::TopologyJobStatus &status)
    {
        Bytes out;
        append_string(out, status.job_id);
        append_string(out, status.seed);
        append_enum(out, status.status);
        append_u32_be(out, status.switch_count);
        append_u32_be(out, status.device_count);
        append_string(out, status.last_switch);

        append_u32_be(out, static_cast<uint32_t>(status.switches.size()));
        for (const auto &sw : status.switches)
            append_switch(out, sw);

        append_bool(out, status.persisted.has_value());
        if (status.persisted)
        {
            append_i32(out, status.persisted->inserted);
            append_i32(out, status.persisted->updated);
        }
        append_opt_string(out, status.error);

        append_time(out, status.started);
        append_bool(out, status.finished.has_value());
        if (status.finished)
            append_time(out, *status.finished);

        append_walk_options(out, status.options);
        return out;
    }

    bool DecodeTopologyStatus(const Bytes &in, engine::TopologyJobStatus &out)
    {
        std::size_t offset = 0;
        uint32_t count = 0;
        if (!read_string(in, offset, out.job_id) || !read_string(in, offset, out.seed) ||
            !read_enum(in, offset, engine::WalkStatus::Error, out.status) ||
            !read_u32_be(in, offset, out.switch_count) || !read_u32_be(in, offset, out.device_count) ||
            !read_string(in, offset, out.last_switch) || !read_count(in, offset, count))
            return false;

        out.switches.clear();
        for (uint32_t i = 0; i < count; ++i)
        {
            engine::TopologyWalkResult sw;
            if (!read_switch(in, offset, sw))
                return false;
            out.switches.push_back(std::move(sw));
        }

        bool has_persisted = false;
        if (!read_bool(in, offset, has_persisted))
            return false;
        out.persisted.reset();
        if (has_persisted)
        {
            engine::PersistCounts counts;
            if (!read_int(in, offset, counts.inserted) || !read_int(in, offset, counts.updated))
                return false;
            out.persisted = counts;
        }

        bool has_finished = false;
        if (!read_opt_string(in, offset, out.error) || !read_time(in, offset, out.started) ||
            !read_bool(in, offset, has_finished))
            return false;

        out.finished.reset();
        if (has_finished)
        {
            std::chrono::system_clock::time_point tp;
            if (!read_time(in, offset, tp))
                return false;
            out.finished = tp;
        }

        return read_walk_options(in, offset, out.options) && Finished(in, offset);
    }

    Bytes EncodeSignals(const engine::ClassificationSignals &signals)
    {
        Bytes out;
        append_string(out, signals.address);
        append_string(out, signals.mac);
        append_string(out, signals.hostname);
        append_string(out, signals.vendor);
        append_u32_be(out, static_cast<uint32_t>(signals.open_ports.size()));
        for (uint16_t p : signals.open_ports)
            append_u32_be(out, p);
        append_opt_string(out, signals.banner);
        return out;
    }

    bool DecodeSignals(const Bytes &in, engine::ClassificationSignals &out)
    {
        std::size_t offset = 0;
        uint32_t count = 0;
        if (!read_string(in, offset, out.address) || !read_string(in, offset, out.mac) ||
            !read_string(in, offset, out.hostname) || !read_string(in, offset, out.vendor) ||
            !read_count(in, offset, count))
            return false;

        out.open_ports.clear();
        for (uint32_t i = 0; i < count; ++i)
        {
            uint32_t port = 0;
            if (!read_u32_be(in, offset, port) || port > 65535)
                return false;
            out.open_ports.push_back(static_cast<uint16_t>(port));
        }
        return read_opt_string(in, offset, out.banner) && Finished(in, offset);
    }

    Bytes EncodeClassification(const engine::ClassificationResult &result)
    {
        Bytes out;
        append_classification(out, result);
        return out;
    }

    bool DecodeClassification(const Bytes &in, engine::ClassificationResult &out)
    {
        std::size_t offset = 0;
        return read_classification(in, offset, out) && Finished(in, offset);
    }
}
