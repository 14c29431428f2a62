#pragma once

#include <istream>
#include <string>
#include <string_view>
#include <vector>
#include "DeviceRecord.hpp"

namespace lan_watch::monitor
{
    // "true", "1", "yes" and "ja", any case.
    bool ParseFlag(std::string_view token);

    // Lines look like "ip,hostname,required[,vip]". Comments, blank lines and
    // malformed lines are skipped.
    std::vector<KnownHost> ParseKnownHosts(std::istream &in, const std::string &source_name = "<stream>");

    // A missing file is not an error: it logs a warning and yields no hosts.
    std::vector<KnownHost> LoadKnownHosts(const std::string &path);
}
