#include "Ber.hpp"

#include <cctype>
#include <iomanip>
#include <sstream>

namespace net_survey::engine
{
    Oid ParseOid(const std::string &dotted)
    {
        Oid oid;
        std::string text = dotted;
        if (!text.empty() && text[0] == '.')
            text.erase(0, 1);

        std::stringstream ss(text);
        std::string part;
        while (std::getline(ss, part, '.'))
        {
            if (part.empty() || part.size() > 10)
                throw SnmpError("Invalid OID: " + dotted);
            for (unsigned char c : part)
            {
                if (!std::isdigit(c))
                    throw SnmpError("Invalid OID: " + dotted);
            }
            unsigned long value = std::stoul(part);
            if (value > 0xFFFFFFFFul)
                throw SnmpError("OID component out of range: " + dotted);
            oid.push_back(static_cast<uint32_t>(value));
        }

        if (oid.size() < 2)
            throw SnmpError("Invalid OID: " + dotted);
        return oid;
    }

    std::string OidToString(const Oid &oid)
    {
        std::string out;
        for (size_t i = 0; i < oid.size(); ++i)
        {
            if (i)
                out += '.';
            out += std::to_string(oid[i]);
        }
        return out;
    }

    bool OidStartsWith(const Oid &oid, const Oid &prefix)
    {
        if (oid.size() < prefix.size())
            return false;
        for (size_t i = 0; i < prefix.size(); ++i)
        {
            if (oid[i] != prefix[i])
                return false;
        }
        return true;
    }

    Oid OidSuffix(const Oid &oid, const Oid &prefix)
    {
        if (oid.size() <= prefix.size() || !OidStartsWith(oid, prefix))
            return {};
        return Oid(oid.begin() + prefix.size(), oid.end());
    }

    namespace ber
    {
        void AppendLength(std::vector<uint8_t> &buf, std::size_t length)
        {
            if (length < 0x80)
            {
                buf.push_back(static_cast<uint8_t>(length));
                return;
            }

            std::vector<uint8_t> bytes;
            while (length > 0)
            {
                bytes.insert(bytes.begin(), static_cast<uint8_t>(length & 0xFF));
                length >>= 8;
            }
            buf.push_back(static_cast<uint8_t>(0x80 | bytes.size()));
            buf.insert(buf.end(), bytes.begin(), bytes.end());
        }

        void AppendTLV(std::vector<uint8_t> &buf, uint8_t type, const std::vector<uint8_t> &value)
        {
            buf.push_back(type);
            AppendLength(buf, value.size());
            buf.insert(buf.end(), value.begin(), value.end());
        }

        namespace
        {
            // Minimal two's complement, big-endian.
            std::vector<uint8_t> IntegerBytes(int64_t value)
            {
                std::vector<uint8_t> bytes;
                for (int shift = 56; shift >= 0; shift -= 8)
                    bytes.push_back(static_cast<uint8_t>((static_cast<uint64_t>(value) >> shift) & 0xFF));

                size_t start = 0;
                while (start + 1 < bytes.size())
                {
                    bool redundant_zero = bytes[start] == 0x00 && !(bytes[start + 1] & 0x80);
                    bool redundant_ff = bytes[start] == 0xFF && (bytes[start + 1] & 0x80);
                    if (!redundant_zero && !redundant_ff)
                        break;
                    ++start;
                }
                return std::vector<uint8_t>(bytes.begin() + start, bytes.end());
            }

            std::vector<uint8_t> UnsignedBytes(uint64_t value)
            {
                std::vector<uint8_t> bytes;
                do
                {
                    bytes.insert(bytes.begin(), static_cast<uint8_t>(value & 0xFF));
                    value >>= 8;
                } while (value > 0);
                if (bytes.front() & 0x80)
                    bytes.insert(bytes.begin(), 0x00);
                return bytes;
            }

            void AppendSubId(std::vector<uint8_t> &out, uint64_t value)
            {
                std::vector<uint8_t> tmp;
                tmp.push_back(static_cast<uint8_t>(value & 0x7F));
                value >>= 7;
                while (value > 0)
                {
                    tmp.insert(tmp.begin(), static_cast<uint8_t>(0x80 | (value & 0x7F)));
                    value >>= 7;
                }
                out.insert(out.end(), tmp.begin(), tmp.end());
            }
        }

        void AppendInteger(std::vector<uint8_t> &buf, int64_t value)
        {
            AppendTLV(buf, Integer, IntegerBytes(value));
        }

        void AppendString(std::vector<uint8_t> &buf, const std::string &str)
        {
            std::vector<uint8_t> valBytes(str.begin(), str.end());
            AppendTLV(buf, OctetString, valBytes);
        }

        void AppendNull(std::vector<uint8_t> &buf)
        {
            AppendTLV(buf, Null, {});
        }

        void AppendOid(std::vector<uint8_t> &buf, const Oid &oid)
        {
            if (oid.size() < 2)
                throw SnmpError("OID needs at least two components");

            std::vector<uint8_t> body;
            AppendSubId(body, static_cast<uint64_t>(oid[0]) * 40 + oid[1]);
            for (size_t i = 2; i < oid.size(); ++i)
                AppendSubId(body, oid[i]);
            AppendTLV(buf, ObjectIdentifier, body);
        }

        Tlv ReadTlv(const std::vector<uint8_t> &in, std::size_t &offset)
        {
            if (offset + 2 > in.size())
                throw SnmpError("Truncated BER element");

            Tlv tlv;
            tlv.tag = in[offset++];

            uint8_t first = in[offset++];
            if (first < 0x80)
            {
                tlv.length = first;
            }
            else
            {
                size_t count = first & 0x7F;
                if (count == 0 || count > 4)
                    throw SnmpError("Unsupported BER length encoding");
                if (offset + count > in.size())
                    throw SnmpError("Truncated BER length");
                for (size_t i = 0; i < count; ++i)
                    tlv.length = (tlv.length << 8) | in[offset++];
            }

            if (tlv.length > in.size() - offset)
                throw SnmpError("BER length exceeds packet");

            tlv.value_offset = offset;
            offset += tlv.length;
            return tlv;
        }

        Tlv Expect(const std::vector<uint8_t> &in, std::size_t &offset, uint8_t tag)
        {
            Tlv tlv = ReadTlv(in, offset);
            if (tlv.tag != tag)
            {
                std::stringstream ss;
                ss << "Unexpected BER tag 0x" << std::hex << static_cast<int>(tlv.tag)
                   << ", wanted 0x" << static_cast<int>(tag);
                throw SnmpError(ss.str());
            }
            return tlv;
        }

        int64_t DecodeInteger(const std::vector<uint8_t> &in, const Tlv &tlv)
        {
            if (tlv.length == 0 || tlv.length > 8)
                throw SnmpError("Bad INTEGER length");

            int64_t value = (in[tlv.value_offset] & 0x80) ? -1 : 0;
            for (size_t i = 0; i < tlv.length; ++i)
                value = static_cast<int64_t>((static_cast<uint64_t>(value) << 8) | in[tlv.value_offset + i]);
            return value;
        }

        uint64_t DecodeUnsigned(const std::vector<uint8_t> &in, const Tlv &tlv)
        {
            if (tlv.length == 0 || tlv.length > 9)
                throw SnmpError("Bad unsigned length");

            uint64_t value = 0;
            for (size_t i = 0; i < tlv.length; ++i)
                value = (value << 8) | in[tlv.value_offset + i];
            return value;
        }

        Oid DecodeOid(const std::vector<uint8_t> &in, const Tlv &tlv)
        {
            if (tlv.length == 0)
                throw SnmpError("Empty OID");

            std::vector<uint64_t> subids;
            uint64_t current = 0;
            size_t bytes_in_subid = 0;
            for (size_t i = 0; i < tlv.length; ++i)
            {
                uint8_t b = in[tlv.value_offset + i];
                current = (current << 7) | (b & 0x7F);
                if (++bytes_in_subid > 5)
                    throw SnmpError("OID sub-identifier too long");
                if (!(b & 0x80))
                {
                    subids.push_back(current);
                    current = 0;
                    bytes_in_subid = 0;
                }
            }
            if (bytes_in_subid != 0)
                throw SnmpError("Truncated OID sub-identifier");

            Oid oid;
            uint64_t first = subids[0];
            if (first < 40)
                oid = {0, static_cast<uint32_t>(first)};
            else if (first < 80)
                oid = {1, static_cast<uint32_t>(first - 40)};
            else
                oid = {2, static_cast<uint32_t>(first - 80)};

            for (size_t i = 1; i < subids.size(); ++i)
            {
                if (subids[i] > 0xFFFFFFFFull)
                    throw SnmpError("OID sub-identifier out of range");
                oid.push_back(static_cast<uint32_t>(subids[i]));
            }
            return oid;
        }
    }

    bool SnmpValue::IsException() const
    {
        return type == ber::NoSuchObject || type == ber::NoSuchInstance || type == ber::EndOfMibView;
    }

    bool SnmpValue::IsNumeric() const
    {
        switch (type)
        {
        case ber::Integer:
        case ber::Counter32:
        case ber::Gauge32:
        case ber::TimeTicks:
        case ber::Counter64:
            return true;
        default:
            return false;
        }
    }

    std::string SnmpValue::AsString() const
    {
        if (IsNumeric())
            return std::to_string(number);
        if (type == ber::IpAddress)
            return AsIpAddress();
        if (type == ber::ObjectIdentifier)
            return OidToString(oid);

        std::string clean;
        for (unsigned char c : bytes)
        {
            if (c >= 32 && c <= 126)
                clean += static_cast<char>(c);
        }
        return clean;
    }

    std::string SnmpValue::AsMac() const
    {
        if (bytes.size() != 6)
            return "";

        std::stringstream ss;
        for (size_t i = 0; i < bytes.size(); ++i)
        {
            if (i)
                ss << ":";
            ss << std::uppercase << std::hex << std::setw(2) << std::setfill('0')
               << static_cast<int>(static_cast<unsigned char>(bytes[i]));
        }
        return ss.str();
    }

    std::string SnmpValue::AsIpAddress() const
    {
        if (bytes.size() != 4)
            return "";

        std::string out;
        for (size_t i = 0; i < 4; ++i)
        {
            if (i)
                out += '.';
            out += std::to_string(static_cast<unsigned char>(bytes[i]));
        }
        return out;
    }

    uint32_t SnmpValue::AsBits() const
    {
        if (IsNumeric())
            return static_cast<uint32_t>(number);

        uint32_t value = 0;
        for (size_t i = 0; i < bytes.size() && i < 4; ++i)
            value = (value << 8) | static_cast<unsigned char>(bytes[i]);
        return value;
    }

    namespace
    {
        void AppendValue(std::vector<uint8_t> &buf, const SnmpValue &value)
        {
            switch (value.type)
            {
            case ber::Integer:
                ber::AppendInteger(buf, value.number);
                break;
            case ber::Counter32:
            case ber::Gauge32:
            case ber::TimeTicks:
            case ber::Counter64:
                ber::AppendTLV(buf, value.type, ber::UnsignedBytes(static_cast<uint64_t>(value.number)));
                break;
            case ber::ObjectIdentifier:
                ber::AppendOid(buf, value.oid);
                break;
            case ber::OctetString:
            case ber::IpAddress:
            case ber::Opaque:
                ber::AppendTLV(buf, value.type, std::vector<uint8_t>(value.bytes.begin(), value.bytes.end()));
                break;
            default:
                ber::AppendTLV(buf, value.type, {});
                break;
            }
        }

        SnmpValue DecodeValue(const std::vector<uint8_t> &in, const ber::Tlv &tlv)
        {
            SnmpValue value;
            value.type = tlv.tag;
            switch (tlv.tag)
            {
            case ber::Integer:
                value.number = ber::DecodeInteger(in, tlv);
                break;
            case ber::Counter32:
            case ber::Gauge32:
            case ber::TimeTicks:
            case ber::Counter64:
                value.number = static_cast<int64_t>(ber::DecodeUnsigned(in, tlv));
                break;
            case ber::ObjectIdentifier:
                value.oid = ber::DecodeOid(in, tlv);
                break;
            case ber::Null:
            case ber::NoSuchObject:
            case ber::NoSuchInstance:
            case ber::EndOfMibView:
                break;
            default:
                value.bytes.assign(in.begin() + tlv.value_offset, in.begin() + tlv.value_offset + tlv.length);
                break;
            }
            return value;
        }
    }

    std::vector<uint8_t> EncodeMessage(const SnmpMessage &message)
    {
        std::vector<uint8_t> varbind_list;
        for (const auto &vb : message.varbinds)
        {
            std::vector<uint8_t> seq_content;
            ber::AppendOid(seq_content, vb.oid);
            AppendValue(seq_content, vb.value);
            ber::AppendTLV(varbind_list, ber::Sequence, seq_content);
        }

        std::vector<uint8_t> pdu_body;
        ber::AppendInteger(pdu_body, message.request_id);
        ber::AppendInteger(pdu_body, message.error_status);
        ber::AppendInteger(pdu_body, message.error_index);
        ber::AppendTLV(pdu_body, ber::Sequence, varbind_list);

        std::vector<uint8_t> whole_packet_content;
        ber::AppendInteger(whole_packet_content, message.version);
        ber::AppendString(whole_packet_content, message.community);
        ber::AppendTLV(whole_packet_content, message.pdu_type, pdu_body);

        std::vector<uint8_t> final_packet;
        ber::AppendTLV(final_packet, ber::Sequence, whole_packet_content);
        return final_packet;
    }

    std::vector<uint8_t> EncodeRequest(int version, const std::string &community, uint8_t pdu_type,
                                       int32_t request_id, const std::vector<Oid> &oids)
    {
        SnmpMessage message;
        message.version = version;
        message.community = community;
        message.pdu_type = pdu_type;
        message.request_id = request_id;
        for (const auto &oid : oids)
            message.varbinds.push_back({oid, SnmpValue{}});
        return EncodeMessage(message);
    }

    SnmpMessage DecodeMessage(const std::vector<uint8_t> &packet)
    {
        SnmpMessage message;
        std::size_t offset = 0;

        ber::Tlv outer = ber::Expect(packet, offset, ber::Sequence);
        std::size_t pos = outer.value_offset;

        message.version = static_cast<int>(ber::DecodeInteger(packet, ber::Expect(packet, pos, ber::Integer)));

        ber::Tlv community = ber::Expect(packet, pos, ber::OctetString);
        message.community.assign(packet.begin() + community.value_offset,
                                 packet.begin() + community.value_offset + community.length);

        ber::Tlv pdu = ber::ReadTlv(packet, pos);
        if (pdu.tag < ber::GetRequest || pdu.tag > 0xA8)
            throw SnmpError("Not an SNMP PDU");
        message.pdu_type = pdu.tag;

        std::size_t p = pdu.value_offset;
        message.request_id = static_cast<int32_t>(ber::DecodeInteger(packet, ber::Expect(packet, p, ber::Integer)));
        message.error_status = static_cast<int>(ber::DecodeInteger(packet, ber::Expect(packet, p, ber::Integer)));
        message.error_index = static_cast<int>(ber::DecodeInteger(packet, ber::Expect(packet, p, ber::Integer)));

        ber::Tlv list = ber::Expect(packet, p, ber::Sequence);
        std::size_t v = list.value_offset;
        const std::size_t list_end = list.value_offset + list.length;
        while (v < list_end)
        {
            ber::Tlv entry = ber::Expect(packet, v, ber::Sequence);
            std::size_t e = entry.value_offset;

            VarBind vb;
            vb.oid = ber::DecodeOid(packet, ber::Expect(packet, e, ber::ObjectIdentifier));
            vb.value = DecodeValue(packet, ber::ReadTlv(packet, e));
            message.varbinds.push_back(std::move(vb));
        }

        return message;
    }
}
