#pragma once

#include <string>
#include <vector>
#include "Prober.hpp"

namespace lan_watch::monitor
{
    // Runs the system ping binary; needs no raw socket privilege.
    class CommandProber : public Prober
    {
    public:
        explicit CommandProber(std::string program = "ping");

        bool Probe(const std::string &ip, std::chrono::milliseconds timeout) override;

        static std::vector<std::string> BuildArguments(const std::string &program, const std::string &ip,
                                                       std::chrono::milliseconds timeout);

    private:
        std::string m_program;
    };
}
