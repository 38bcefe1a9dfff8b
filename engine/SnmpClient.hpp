#pragma once

#include "Ber.hpp"
#include "Types.hpp"

#include <atomic>
#include <optional>
#include <string>
#include <vector>

namespace net_survey::engine
{
    // Read-only SNMP access to one agent at a time. Errors are SnmpError.
    class SnmpSession
    {
    public:
        virtual ~SnmpSession() = default;

        // All rows under `root` in lexicographic order.
        virtual std::vector<VarBind> Walk(const std::string &host, const Oid &root) = 0;
        virtual std::optional<SnmpValue> Get(const std::string &host, const Oid &oid) = 0;
    };

    // SNMP v1/v2c GET and GET-NEXT over UDP.
    class SnmpClient : public SnmpSession
    {
    public:
        explicit SnmpClient(SnmpCredentials credentials);

        std::vector<VarBind> Walk(const std::string &host, const Oid &root) override;
        std::optional<SnmpValue> Get(const std::string &host, const Oid &oid) override;

        // Upper bound on rows returned by one walk.
        static constexpr std::size_t MAX_WALK_ROWS = 20000;

    private:
        SnmpMessage Request(const std::string &host, uint8_t pdu_type, const Oid &oid);
        int WireVersion() const;

        SnmpCredentials m_credentials;
        std::atomic<int32_t> m_next_request_id;
    };
}
