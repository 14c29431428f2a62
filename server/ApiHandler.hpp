#pragma once

#include <functional>
#include "../common/HttpProtocol.hpp"
#include "../monitor/ViewBuilder.hpp"

namespace lan_watch::server
{
    using RequestHandler = std::function<lan_watch::protocol::Response(const lan_watch::protocol::Request &)>;

    // Routes "/" to the dashboard and "/api/devices" to the device list.
    class ApiHandler
    {
    public:
        using TimeSource = std::function<lan_watch::monitor::TimePoint()>;

        explicit ApiHandler(const lan_watch::monitor::ViewBuilder &view,
                            TimeSource now = []
                            { return lan_watch::monitor::Clock::now(); });

        lan_watch::protocol::Response Handle(const lan_watch::protocol::Request &req) const;

    private:
        lan_watch::protocol::Response HandleDevices() const;
        lan_watch::protocol::Response HandleDashboard() const;

        const lan_watch::monitor::ViewBuilder &m_view;
        TimeSource m_now;
    };
}
