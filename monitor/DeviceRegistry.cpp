#include "DeviceRegistry.hpp"

namespace lan_watch::monitor
{
    DeviceRegistry::DeviceRegistry() : m_baseline_done(false) {}

    void DeviceRegistry::SeedStatic(const std::vector<KnownHost> &hosts, TimePoint now)
    {
        std::lock_guard<std::mutex> lock(m_mutex);

        for (const auto &host : hosts)
        {
            DeviceRecord dev;
            dev.ip = host.ip;
            dev.hostname = host.hostname;
            dev.required = host.required;
            dev.vip = host.vip;
            dev.from_known_hosts = true;
            dev.online = false;
            dev.created_at = now;

            m_devices[host.ip] = dev;
        }
    }

    UpsertOutcome DeviceRegistry::UpsertProbeResult(const std::string &ip, bool success, TimePoint now)
    {
        std::lock_guard<std::mutex> lock(m_mutex);

        auto it = m_devices.find(ip);

        if (!success)
        {
            // Never-reached addresses are not tracked.
            if (it == m_devices.end())
                return UpsertOutcome::Ignored;

            it->second.online = false;
            return UpsertOutcome::Updated;
        }

        if (it == m_devices.end())
        {
            DeviceRecord dev;
            dev.ip = ip;
            dev.from_known_hosts = false;
            dev.first_seen = now;
            dev.last_seen = now;
            dev.online = true;
            dev.created_at = now;

            m_devices.emplace(ip, dev);
            return UpsertOutcome::Discovered;
        }

        DeviceRecord &dev = it->second;
        if (!dev.first_seen.has_value())
            dev.first_seen = now;
        dev.last_seen = now;
        dev.online = true;
        return UpsertOutcome::Updated;
    }

    bool DeviceRegistry::MarkBaselineIfFirstSweep(TimePoint now)
    {
        std::lock_guard<std::mutex> lock(m_mutex);

        if (m_baseline_done)
            return false;

        for (auto &pair : m_devices)
        {
            pair.second.seen_before_baseline = true;
        }
        m_baseline_done = true;
        m_baseline_at = now;
        return true;
    }

    std::vector<std::string> DeviceRegistry::EvictStale(TimePoint now, std::chrono::seconds forget_after)
    {
        std::lock_guard<std::mutex> lock(m_mutex);

        std::vector<std::string> to_delete;
        for (const auto &pair : m_devices)
        {
            const DeviceRecord &dev = pair.second;
            if (dev.from_known_hosts || dev.required || dev.online)
                continue;

            TimePoint base = dev.last_seen.value_or(dev.created_at);
            if (now - base > forget_after)
                to_delete.push_back(pair.first);
        }

        for (const auto &ip : to_delete)
        {
            m_devices.erase(ip);
        }
        return to_delete;
    }

    RegistrySnapshot DeviceRegistry::Snapshot() const
    {
        std::lock_guard<std::mutex> lock(m_mutex);

        RegistrySnapshot snap;
        snap.devices.reserve(m_devices.size());
        for (const auto &pair : m_devices)
        {
            snap.devices.push_back(pair.second);
        }
        snap.baseline_done = m_baseline_done;
        snap.baseline_at = m_baseline_at;
        return snap;
    }

    std::optional<DeviceRecord> DeviceRegistry::Find(const std::string &ip) const
    {
        std::lock_guard<std::mutex> lock(m_mutex);

        auto it = m_devices.find(ip);
        if (it != m_devices.end())
        {
            return it->second;
        }
        return std::nullopt;
    }

    size_t DeviceRegistry::Size() const
    {
        std::lock_guard<std::mutex> lock(m_mutex);
        return m_devices.size();
    }

    bool DeviceRegistry::IsBaselineDone() const
    {
        std::lock_guard<std::mutex> lock(m_mutex);
        return m_baseline_done;
    }

    std::optional<TimePoint> DeviceRegistry::BaselineTime() const
    {
        std::lock_guard<std::mutex> lock(m_mutex);
        return m_baseline_at;
    }
}
