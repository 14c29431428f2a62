#include "ViewBuilder.hpp"
#include "../common/Ipv4.hpp"

#include <algorithm>
#include <utility>

namespace lan_watch::monitor
{
    namespace
    {
        double SecondsBetween(TimePoint from, TimePoint to)
        {
            return std::chrono::duration<double>(to - from).count();
        }

        struct Ranked
        {
            SortGroup group;
            DisplayDevice device;
        };
    }

    bool IsVisible(const DeviceRecord &dev)
    {
        if (dev.online)
            return true;
        if (dev.vip)
            return false;
        return dev.required && dev.from_known_hosts;
    }

    bool IsNewDevice(const DeviceRecord &dev, bool baseline_done, TimePoint now, std::chrono::seconds window)
    {
        if (!dev.online || !dev.first_seen.has_value())
            return false;
        if (!baseline_done || dev.seen_before_baseline)
            return false;

        return SecondsBetween(dev.first_seen.value(), now) <= static_cast<double>(window.count());
    }

    SortGroup GroupOf(const DeviceRecord &dev, bool is_new)
    {
        if (dev.from_known_hosts && dev.required)
            return SortGroup::RequiredStatic;
        if (dev.vip && dev.online)
            return SortGroup::VipOnline;
        if (is_new)
            return SortGroup::NewDevice;
        return SortGroup::Other;
    }

    std::vector<DisplayDevice> Classify(const RegistrySnapshot &snapshot, TimePoint now, const ViewSettings &settings)
    {
        std::vector<Ranked> ranked;
        ranked.reserve(snapshot.devices.size());

        for (const auto &dev : snapshot.devices)
        {
            if (!IsVisible(dev))
                continue;

            DisplayDevice out;
            out.ip = dev.ip;
            out.hostname = dev.hostname;
            out.required = dev.required;
            out.vip = dev.vip;
            out.online = dev.online;
            if (dev.first_seen.has_value())
                out.age_seconds = SecondsBetween(dev.first_seen.value(), now);
            if (dev.last_seen.has_value())
                out.last_seen_seconds_ago = SecondsBetween(dev.last_seen.value(), now);
            out.is_new = IsNewDevice(dev, snapshot.baseline_done, now, settings.new_device_window);

            ranked.push_back({GroupOf(dev, out.is_new), std::move(out)});
        }

        std::sort(ranked.begin(), ranked.end(), [](const Ranked &a, const Ranked &b)
                  {
            if (a.group != b.group)
                return a.group < b.group;
            return lan_watch::common::AddressLess(a.device.ip, b.device.ip); });

        std::vector<DisplayDevice> result;
        result.reserve(ranked.size());
        for (auto &r : ranked)
        {
            result.push_back(std::move(r.device));
        }
        return result;
    }

    ViewBuilder::ViewBuilder(const DeviceRegistry &registry, std::string network, ViewSettings settings)
        : m_registry(registry), m_network(std::move(network)), m_settings(settings)
    {
    }

    std::vector<DisplayDevice> ViewBuilder::BuildView(TimePoint now) const
    {
        return Classify(m_registry.Snapshot(), now, m_settings);
    }

    NetworkStatus ViewBuilder::Query(TimePoint now) const
    {
        return NetworkStatus{m_network, BuildView(now)};
    }
}
