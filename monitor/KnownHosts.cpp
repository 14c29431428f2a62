#include "KnownHosts.hpp"
#include "../common/Ipv4.hpp"

#include <algorithm>
#include <cctype>
#include <fstream>
#include <iostream>
#include <sstream>

namespace lan_watch::monitor
{
    namespace
    {
        std::string Trim(const std::string &s)
        {
            auto begin = s.find_first_not_of(" \t\r\n");
            if (begin == std::string::npos)
                return "";
            auto end = s.find_last_not_of(" \t\r\n");
            return s.substr(begin, end - begin + 1);
        }

        std::vector<std::string> SplitFields(const std::string &line)
        {
            std::vector<std::string> parts;
            std::stringstream ss(line);
            std::string part;
            while (std::getline(ss, part, ','))
            {
                parts.push_back(Trim(part));
            }
            if (!line.empty() && line.back() == ',')
                parts.push_back("");
            return parts;
        }
    }

    bool ParseFlag(std::string_view token)
    {
        std::string lowered(token);
        std::transform(lowered.begin(), lowered.end(), lowered.begin(), [](unsigned char c)
                       { return static_cast<char>(std::tolower(c)); });
        return lowered == "true" || lowered == "1" || lowered == "yes" || lowered == "ja";
    }

    std::vector<KnownHost> ParseKnownHosts(std::istream &in, const std::string &source_name)
    {
        std::vector<KnownHost> hosts;

        std::string raw;
        int line_no = 0;
        while (std::getline(in, raw))
        {
            ++line_no;
            std::string line = Trim(raw);
            if (line.empty() || line.front() == '#')
                continue;

            auto parts = SplitFields(line);
            if (parts.size() < 3)
            {
                std::cerr << "[KnownHosts] WARN: " << source_name << ":" << line_no
                          << " has fewer than 3 fields, skipped\n";
                continue;
            }

            if (!lan_watch::common::ParseIpv4(parts[0]).has_value())
            {
                std::cerr << "[KnownHosts] WARN: " << source_name << ":" << line_no
                          << " invalid IPv4 address '" << parts[0] << "', skipped\n";
                continue;
            }

            KnownHost host;
            host.ip = parts[0];
            if (!parts[1].empty())
                host.hostname = parts[1];
            host.required = ParseFlag(parts[2]);
            host.vip = parts.size() >= 4 && ParseFlag(parts[3]);

            // A repeated address keeps its first position but takes the newer metadata.
            auto existing = std::find_if(hosts.begin(), hosts.end(), [&host](const KnownHost &h)
                                         { return h.ip == host.ip; });
            if (existing != hosts.end())
                *existing = host;
            else
                hosts.push_back(host);
        }

        return hosts;
    }

    std::vector<KnownHost> LoadKnownHosts(const std::string &path)
    {
        std::ifstream file(path);
        if (!file.is_open())
        {
            std::cerr << "[KnownHosts] WARN: " << path << " not found; continuing without predefined hosts\n";
            return {};
        }

        auto hosts = ParseKnownHosts(file, path);
        std::cout << "[KnownHosts] Loaded " << hosts.size() << " predefined host(s) from " << path << "\n";
        return hosts;
    }
}
