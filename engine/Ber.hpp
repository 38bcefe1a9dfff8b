#pragma once

#include <cstddef>
#include <cstdint>
#include <stdexcept>
#include <string>
#include <vector>

namespace net_survey::engine
{
    // Timeouts, SNMP error-status responses and malformed BER.
    class SnmpError : public std::runtime_error
    {
    public:
        explicit SnmpError(const std::string &what) : std::runtime_error(what) {}
    };

    using Oid = std::vector<uint32_t>;

    // "1.3.6.1.2.1" (a leading dot is tolerated). Throws SnmpError.
    Oid ParseOid(const std::string &dotted);
    std::string OidToString(const Oid &oid);
    bool OidStartsWith(const Oid &oid, const Oid &prefix);
    // Sub-identifiers of `oid` after `prefix`; empty if it is not a child.
    Oid OidSuffix(const Oid &oid, const Oid &prefix);

    namespace ber
    {
        enum Tag : uint8_t
        {
            Integer = 0x02,
            OctetString = 0x04,
            Null = 0x05,
            ObjectIdentifier = 0x06,
            Sequence = 0x30,
            IpAddress = 0x40,
            Counter32 = 0x41,
            Gauge32 = 0x42,
            TimeTicks = 0x43,
            Opaque = 0x44,
            Counter64 = 0x46,
            NoSuchObject = 0x80,
            NoSuchInstance = 0x81,
            EndOfMibView = 0x82,
            GetRequest = 0xA0,
            GetNextRequest = 0xA1,
            GetResponse = 0xA2
        };

        void AppendLength(std::vector<uint8_t> &buf, std::size_t length);
        void AppendTLV(std::vector<uint8_t> &buf, uint8_t type, const std::vector<uint8_t> &value);
        void AppendInteger(std::vector<uint8_t> &buf, int64_t value);
        void AppendString(std::vector<uint8_t> &buf, const std::string &str);
        void AppendNull(std::vector<uint8_t> &buf);
        void AppendOid(std::vector<uint8_t> &buf, const Oid &oid);

        struct Tlv
        {
            uint8_t tag = 0;
            std::size_t value_offset = 0;
            std::size_t length = 0;
        };

        // Reads one TLV header at `offset` and moves `offset` past the whole
        // element. Throws SnmpError on truncation or unsupported lengths.
        Tlv ReadTlv(const std::vector<uint8_t> &in, std::size_t &offset);
        // Like ReadTlv, but also checks the tag.
        Tlv Expect(const std::vector<uint8_t> &in, std::size_t &offset, uint8_t tag);

        int64_t DecodeInteger(const std::vector<uint8_t> &in, const Tlv &tlv);
        uint64_t DecodeUnsigned(const std::vector<uint8_t> &in, const Tlv &tlv);
        Oid DecodeOid(const std::vector<uint8_t> &in, const Tlv &tlv);
    }

    struct SnmpValue
    {
        uint8_t type = ber::Null;
        int64_t number = 0;
        std::string bytes;
        Oid oid;

        // noSuchObject, noSuchInstance and endOfMibView.
        bool IsException() const;
        bool IsNumeric() const;
        // OCTET STRING as text with non-printable bytes dropped, numbers in
        // decimal, IpAddress dotted.
        std::string AsString() const;
        // Six-byte OCTET STRING rendered "AA:BB:CC:DD:EE:FF".
        std::string AsMac() const;
        std::string AsIpAddress() const;
        // Big-endian value of a numeric or OCTET STRING (BITS) payload.
        uint32_t AsBits() const;
    };

    struct VarBind
    {
        Oid oid;
        SnmpValue value;
    };

    struct SnmpMessage
    {
        int version = 1;
        std::string community;
        uint8_t pdu_type = ber::GetResponse;
        int32_t request_id = 0;
        int error_status = 0;
        int error_index = 0;
        std::vector<VarBind> varbinds;
    };

    // version is the wire value: 0 for v1, 1 for v2c.
    std::vector<uint8_t> EncodeRequest(int version, const std::string &community, uint8_t pdu_type,
                                       int32_t request_id, const std::vector<Oid> &oids);
    std::vector<uint8_t> EncodeMessage(const SnmpMessage &message);
    SnmpMessage DecodeMessage(const std::vector<uint8_t> &packet);
}
