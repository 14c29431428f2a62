#pragma once

#include <chrono>
#include <optional>
#include <string>
#include <vector>

namespace lan_watch::monitor
{
    using Clock = std::chrono::system_clock;
    using TimePoint = Clock::time_point;

    struct KnownHost
    {
        std::string ip;
        std::optional<std::string> hostname;
        bool required = false;
        bool vip = false;
    };

    struct DeviceRecord
    {
        std::string ip;
        std::optional<std::string> hostname;
        bool required = false;
        bool vip = false;
        bool from_known_hosts = false;

        std::optional<TimePoint> first_seen;
        std::optional<TimePoint> last_seen;
        bool online = false;
        TimePoint created_at;

        bool seen_before_baseline = false;
    };

    struct RegistrySnapshot
    {
        std::vector<DeviceRecord> devices;
        bool baseline_done = false;
        std::optional<TimePoint> baseline_at;
    };
}
