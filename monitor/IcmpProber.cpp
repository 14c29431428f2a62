#include "IcmpProber.hpp"

#include <iostream>
#include <memory>
#include <tins/tins.h>
#include <unistd.h>

namespace lan_watch::monitor
{
    IcmpProber::IcmpProber()
        : m_identifier(static_cast<std::uint16_t>(getpid() & 0xFFFF)), m_sequence(0), m_reported_failure(false)
    {
    }

    bool IcmpProber::Probe(const std::string &ip, std::chrono::milliseconds timeout)
    {
        try
        {
            const auto total_ms = timeout.count();
            Tins::PacketSender sender(Tins::NetworkInterface(),
                                      static_cast<uint32_t>(total_ms / 1000),
                                      static_cast<uint32_t>((total_ms % 1000) * 1000));

            Tins::IP packet = Tins::IP(ip) / Tins::ICMP();
            Tins::ICMP &icmp = packet.rfind_pdu<Tins::ICMP>();
            icmp.type(Tins::ICMP::ECHO_REQUEST);
            icmp.id(m_identifier);
            icmp.sequence(++m_sequence);

            // send_recv matches the echo reply on address, id and sequence.
            std::unique_ptr<Tins::PDU> reply(sender.send_recv(packet));
            return reply != nullptr;
        }
        catch (const std::exception &e)
        {
            if (!m_reported_failure.exchange(true))
            {
                std::cerr << "[IcmpProber] WARN: probe of " << ip << " failed: " << e.what()
                          << " (raw sockets need root or CAP_NET_RAW; PROBE_METHOD=command avoids this)\n";
            }
            return false;
        }
    }
}
