#pragma once

#include <cstdint>
#include <vector>
#include <cstring>
#include "protocol.hpp"

namespace net_survey::common
{

    // Reassembles framed messages from a byte stream that may arrive in
    // arbitrary fragments.
    class ByteBuffer
    {
    private:
        std::vector<uint8_t> m_buffer;

    public:
        ByteBuffer() = default;
        void Append(const uint8_t *data, size_t size);
        bool HasHeader() const;
        net_survey::protocol::Header PeekHeader() const;
        bool HasValidMagic() const;
        bool IsOversized(const net_survey::protocol::Header &hdr) const;
        bool HasCompleteMessage(const net_survey::protocol::Header &hdr) const;
        void Consume(size_t bytes);
        std::vector<uint8_t> ExtractPayload(size_t payload_len);
        void Clear() { m_buffer.clear(); }
        size_t Size() const { return m_buffer.size(); }
    };

}
