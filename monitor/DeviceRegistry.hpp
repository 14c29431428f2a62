#pragma once

#include <chrono>
#include <mutex>
#include <optional>
#include <string>
#include <unordered_map>
#include <vector>
#include "DeviceRecord.hpp"

namespace lan_watch::monitor
{
    enum class UpsertOutcome
    {
        Ignored,
        Discovered,
        Updated
    };

    // Owns every device record. Each method holds the lock for its whole body,
    // so callers only ever see complete records.
    class DeviceRegistry
    {
    private:
        std::unordered_map<std::string, DeviceRecord> m_devices;
        bool m_baseline_done;
        std::optional<TimePoint> m_baseline_at;
        mutable std::mutex m_mutex;

    public:
        DeviceRegistry();

        DeviceRegistry(const DeviceRegistry &) = delete;
        DeviceRegistry &operator=(const DeviceRegistry &) = delete;

        void SeedStatic(const std::vector<KnownHost> &hosts, TimePoint now);

        UpsertOutcome UpsertProbeResult(const std::string &ip, bool success, TimePoint now);

        // Returns true only for the call that performed the transition.
        bool MarkBaselineIfFirstSweep(TimePoint now);

        // Returns the evicted addresses.
        std::vector<std::string> EvictStale(TimePoint now, std::chrono::seconds forget_after);

        RegistrySnapshot Snapshot() const;

        std::optional<DeviceRecord> Find(const std::string &ip) const;
        size_t Size() const;
        bool IsBaselineDone() const;
        std::optional<TimePoint> BaselineTime() const;
    };
}
