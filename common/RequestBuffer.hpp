#pragma once

#include <cstdint>
#include <optional>
#include <string>
#include "HttpProtocol.hpp"

namespace lan_watch::common
{
    // Accumulates bytes from one connection until a full request head is in.
    class RequestBuffer
    {
    private:
        std::string m_buffer;

    public:
        RequestBuffer() = default;
        void Append(const uint8_t *data, size_t size);
        bool HasCompleteHead() const;
        bool IsOverLimit() const;
        std::optional<lan_watch::protocol::Request> ExtractRequest();
        void Clear() { m_buffer.clear(); }
        size_t Size() const { return m_buffer.size(); }
    };
}
