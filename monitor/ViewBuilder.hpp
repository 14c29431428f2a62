#pragma once

#include <chrono>
#include <optional>
#include <string>
#include <vector>
#include "DeviceRecord.hpp"
#include "DeviceRegistry.hpp"

namespace lan_watch::monitor
{
    // Display ordering buckets, lowest first.
    enum class SortGroup : int
    {
        RequiredStatic = 0,
        VipOnline = 1,
        NewDevice = 2,
        Other = 3
    };

    struct ViewSettings
    {
        std::chrono::seconds new_device_window{300};
    };

    struct DisplayDevice
    {
        std::string ip;
        std::optional<std::string> hostname;
        bool required = false;
        bool vip = false;
        bool online = false;
        std::optional<double> age_seconds;
        std::optional<double> last_seen_seconds_ago;
        bool is_new = false;
    };

    struct NetworkStatus
    {
        std::string network;
        std::vector<DisplayDevice> devices;
    };

    // Offline devices show only when required and seeded from the known hosts
    // file, and never when VIP.
    bool IsVisible(const DeviceRecord &dev);

    bool IsNewDevice(const DeviceRecord &dev, bool baseline_done, TimePoint now, std::chrono::seconds window);

    SortGroup GroupOf(const DeviceRecord &dev, bool is_new);

    std::vector<DisplayDevice> Classify(const RegistrySnapshot &snapshot, TimePoint now, const ViewSettings &settings);

    class ViewBuilder
    {
    public:
        ViewBuilder(const DeviceRegistry &registry, std::string network, ViewSettings settings);

        std::vector<DisplayDevice> BuildView(TimePoint now) const;
        NetworkStatus Query(TimePoint now) const;

        const std::string &Network() const { return m_network; }

    private:
        const DeviceRegistry &m_registry;
        std::string m_network;
        ViewSettings m_settings;
    };
}
