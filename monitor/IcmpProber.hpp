#pragma once

#include <atomic>
#include <cstdint>
#include "Prober.hpp"

namespace lan_watch::monitor
{
    // ICMP echo over a raw socket (root or CAP_NET_RAW).
    class IcmpProber : public Prober
    {
    public:
        IcmpProber();

        bool Probe(const std::string &ip, std::chrono::milliseconds timeout) override;

    private:
        std::uint16_t m_identifier;
        std::atomic<std::uint16_t> m_sequence;
        std::atomic<bool> m_reported_failure;
    };
}
