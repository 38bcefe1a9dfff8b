#include "ByteBuffer.hpp"
#include <stdexcept>

namespace net_survey::common
{
    void ByteBuffer::Append(const uint8_t *data, size_t size)
    {
        m_buffer.insert(m_buffer.end(), data, data + size);
    }

    bool ByteBuffer::HasHeader() const
    {
        return m_buffer.size() >= net_survey::protocol::HEADER_SIZE;
    }

    net_survey::protocol::Header ByteBuffer::PeekHeader() const
    {
        if (!HasHeader())
            throw std::runtime_error("ByteBuffer::PeekHeader - Not enough bytes");
        return net_survey::protocol::DeserializeHeader(m_buffer.data());
    }

    bool ByteBuffer::HasValidMagic() const
    {
        return HasHeader() && PeekHeader().magic == net_survey::protocol::EXPECTED_MAGIC;
    }

    bool ByteBuffer::IsOversized(const net_survey::protocol::Header &hdr) const
    {
        return hdr.payload_length > net_survey::protocol::MAX_PAYLOAD_LENGTH;
    }

    bool ByteBuffer::HasCompleteMessage(const net_survey::protocol::Header &hdr) const
    {
        if (IsOversized(hdr))
            return false;

        return m_buffer.size() >= (net_survey::protocol::HEADER_SIZE + hdr.payload_length);
    }

    void ByteBuffer::Consume(size_t bytes)
    {
        if (bytes > m_buffer.size())
        {
            m_buffer.clear();
            return;
        }
        m_buffer.erase(m_buffer.begin(), m_buffer.begin() + bytes);
    }

    std::vector<uint8_t> ByteBuffer::ExtractPayload(size_t payload_len)
    {
        if (net_survey::protocol::HEADER_SIZE + payload_len > m_buffer.size())
            throw std::runtime_error("ByteBuffer::ExtractPayload - Buffer underflow");

        auto start_it = m_buffer.begin() + net_survey::protocol::HEADER_SIZE;
        return std::vector<uint8_t>(start_it, start_it + payload_len);
    }
}
