#include "SnmpClient.hpp"
#include "Socket.hpp"

#include <memory>
#include <random>

namespace net_survey::engine
{
    namespace
    {
        constexpr int ERROR_NO_SUCH_NAME = 2;
    }

    SnmpClient::SnmpClient(SnmpCredentials credentials)
        : m_credentials(std::move(credentials)),
          m_next_request_id(static_cast<int32_t>(std::random_device{}() & 0x3FFFFFFF))
    {
        if (m_credentials.version != "1" && m_credentials.version != "2c")
            throw SnmpError("Unsupported SNMP version: " + m_credentials.version);
    }

    int SnmpClient::WireVersion() const
    {
        return m_credentials.version == "1" ? 0 : 1;
    }

    SnmpMessage SnmpClient::Request(const std::string &host, uint8_t pdu_type, const Oid &oid)
    {
        const int32_t request_id = m_next_request_id.fetch_add(1) & 0x7FFFFFFF;
        const auto packet = EncodeRequest(WireVersion(), m_credentials.community, pdu_type, request_id, {oid});

        std::unique_ptr<UdpSocket> socket;
        try
        {
            socket = std::make_unique<UdpSocket>();
        }
        catch (const std::runtime_error &e)
        {
            throw SnmpError(e.what());
        }

        UdpSocket &sock = *socket;
        for (int attempt = 0; attempt <= m_credentials.retries; ++attempt)
        {
            auto reply = sock.Exchange(host, m_credentials.port, packet, m_credentials.timeout_ms);
            if (!reply)
                continue;

            SnmpMessage response = DecodeMessage(*reply);
            if (response.request_id != request_id)
                continue;
            if (response.pdu_type != ber::GetResponse)
                throw SnmpError("Unexpected PDU from " + host);
            return response;
        }

        throw SnmpError("Timeout waiting for " + host + " (" + OidToString(oid) + ")");
    }

    std::optional<SnmpValue> SnmpClient::Get(const std::string &host, const Oid &oid)
    {
        SnmpMessage response = Request(host, ber::GetRequest, oid);
        if (response.error_status == ERROR_NO_SUCH_NAME)
            return std::nullopt;
        if (response.error_status != 0)
            throw SnmpError("SNMP error-status " + std::to_string(response.error_status) + " from " + host);
        if (response.varbinds.empty() || response.varbinds[0].value.IsException())
            return std::nullopt;
        return response.varbinds[0].value;
    }

    std::vector<VarBind> SnmpClient::Walk(const std::string &host, const Oid &root)
    {
        std::vector<VarBind> rows;
        Oid current = root;

        while (rows.size() < MAX_WALK_ROWS)
        {
            SnmpMessage response = Request(host, ber::GetNextRequest, current);

            // v1 agents signal the end of the view with noSuchName.
            if (response.error_status == ERROR_NO_SUCH_NAME)
                break;
            if (response.error_status != 0)
                throw SnmpError("SNMP error-status " + std::to_string(response.error_status) + " walking " +
                                OidToString(root) + " on " + host);
            if (response.varbinds.empty())
                break;

            VarBind &vb = response.varbinds[0];
            if (vb.value.IsException() || !OidStartsWith(vb.oid, root))
                break;
            // Agents that do not advance would loop forever.
            if (!(current < vb.oid))
                throw SnmpError("Agent " + host + " returned a non-increasing OID " + OidToString(vb.oid));

            current = vb.oid;
            rows.push_back(std::move(vb));
        }

        return rows;
    }
}
