#pragma once

#include <chrono>
#include <string>

namespace lan_watch::monitor
{
    // One liveness check against one address. Implementations are called from
    // many probe workers at once and must never throw for an unreachable host.
    class Prober
    {
    public:
        virtual ~Prober() = default;
        virtual bool Probe(const std::string &ip, std::chrono::milliseconds timeout) = 0;
    };
}
