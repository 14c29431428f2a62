#include "RequestBuffer.hpp"
#include <stdexcept>

namespace lan_watch::common
{
    void RequestBuffer::Append(const uint8_t *data, size_t size)
    {
        m_buffer.append(reinterpret_cast<const char *>(data), size);
    }

    bool RequestBuffer::HasCompleteHead() const
    {
        return m_buffer.find(lan_watch::protocol::HEAD_TERMINATOR) != std::string::npos;
    }

    bool RequestBuffer::IsOverLimit() const
    {
        auto end = m_buffer.find(lan_watch::protocol::HEAD_TERMINATOR);
        if (end == std::string::npos)
            return m_buffer.size() > lan_watch::protocol::MAX_REQUEST_HEAD;
        return end > lan_watch::protocol::MAX_REQUEST_HEAD;
    }

    std::optional<lan_watch::protocol::Request> RequestBuffer::ExtractRequest()
    {
        auto end = m_buffer.find(lan_watch::protocol::HEAD_TERMINATOR);
        if (end == std::string::npos)
            throw std::runtime_error("RequestBuffer::ExtractRequest - Head not complete");

        auto req = lan_watch::protocol::ParseRequestHead(std::string_view(m_buffer).substr(0, end + 2));
        m_buffer.erase(0, end + lan_watch::protocol::HEAD_TERMINATOR.size());
        return req;
    }
}
