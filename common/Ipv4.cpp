#include "Ipv4.hpp"

#include <arpa/inet.h>
#include <stdexcept>

namespace lan_watch::common
{
    std::optional<std::uint32_t> ParseIpv4(std::string_view text)
    {
        if (text.empty() || text.size() >= INET_ADDRSTRLEN)
            return std::nullopt;

        std::string buffer(text);
        in_addr addr{};
        if (inet_pton(AF_INET, buffer.c_str(), &addr) != 1)
            return std::nullopt;

        return ntohl(addr.s_addr);
    }

    std::string FormatIpv4(std::uint32_t value)
    {
        in_addr addr{};
        addr.s_addr = htonl(value);

        char ip_str[INET_ADDRSTRLEN];
        if (inet_ntop(AF_INET, &addr, ip_str, INET_ADDRSTRLEN) == nullptr)
            throw std::runtime_error("inet_ntop failed");

        return std::string(ip_str);
    }

    std::uint32_t NetmaskFor(int prefix_length)
    {
        if (prefix_length <= 0)
            return 0;
        if (prefix_length >= MAX_PREFIX_LENGTH)
            return 0xFFFFFFFFu;
        return ~((1u << (MAX_PREFIX_LENGTH - prefix_length)) - 1u);
    }

    Cidr ParseCidr(const std::string &text)
    {
        auto slash = text.find('/');
        std::string address_part = text.substr(0, slash);

        auto address = ParseIpv4(address_part);
        if (!address.has_value())
            throw std::invalid_argument("Invalid network address in CIDR '" + text + "'");

        int prefix_length = MAX_PREFIX_LENGTH;
        if (slash != std::string::npos)
        {
            std::string prefix_part = text.substr(slash + 1);
            if (prefix_part.empty() || prefix_part.size() > 2 ||
                prefix_part.find_first_not_of("0123456789") != std::string::npos)
            {
                throw std::invalid_argument("Invalid prefix length in CIDR '" + text + "'");
            }

            prefix_length = std::stoi(prefix_part);
            if (prefix_length > MAX_PREFIX_LENGTH)
                throw std::invalid_argument("Prefix length out of range in CIDR '" + text + "'");
        }

        return Cidr{address.value() & NetmaskFor(prefix_length), prefix_length};
    }

    std::uint64_t HostCount(const Cidr &cidr)
    {
        std::uint64_t block = std::uint64_t{1} << (MAX_PREFIX_LENGTH - cidr.prefix_length);
        if (cidr.prefix_length >= MAX_PREFIX_LENGTH - 1)
            return block;
        return block - 2;
    }

    std::vector<std::string> ExpandHosts(const Cidr &cidr)
    {
        std::vector<std::string> hosts;

        uint32_t network_val = cidr.network;
        uint32_t broadcast_val = network_val | ~NetmaskFor(cidr.prefix_length);

        uint32_t start_scan = network_val;
        uint32_t end_scan = broadcast_val;
        if (cidr.prefix_length < MAX_PREFIX_LENGTH - 1)
        {
            start_scan = network_val + 1;
            end_scan = broadcast_val - 1;
        }

        hosts.reserve(static_cast<std::size_t>(HostCount(cidr)));
        for (uint32_t t = start_scan;; ++t)
        {
            hosts.push_back(FormatIpv4(t));
            if (t == end_scan)
                break;
        }
        return hosts;
    }

    bool AddressLess(const std::string &lhs, const std::string &rhs)
    {
        auto l = ParseIpv4(lhs);
        auto r = ParseIpv4(rhs);

        if (l.has_value() && r.has_value())
            return l.value() < r.value();
        if (l.has_value() != r.has_value())
            return l.has_value();
        return lhs < rhs;
    }
}
