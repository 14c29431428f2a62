#pragma once

#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace lan_watch::common
{
    inline constexpr int MAX_PREFIX_LENGTH = 32;

    struct Cidr
    {
        std::uint32_t network;
        int prefix_length;
    };

    // Dotted-quad only; no shorthand forms like "10.1".
    std::optional<std::uint32_t> ParseIpv4(std::string_view text);

    std::string FormatIpv4(std::uint32_t value);

    // Host bits are masked off, so "10.0.0.7/24" yields 10.0.0.0/24.
    // Throws std::invalid_argument on malformed input.
    Cidr ParseCidr(const std::string &text);

    std::uint32_t NetmaskFor(int prefix_length);

    std::uint64_t HostCount(const Cidr &cidr);

    // Usable hosts: network and broadcast are excluded except for /31 and /32,
    // where every address in the block is returned.
    std::vector<std::string> ExpandHosts(const Cidr &cidr);

    // Numeric ordering for dotted-quad strings. Unparsable strings sort after
    // every valid address, by text.
    bool AddressLess(const std::string &lhs, const std::string &rhs);
}
