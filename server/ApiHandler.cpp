#include "ApiHandler.hpp"
#include "DashboardPage.hpp"
#include "../monitor/StatusCodec.hpp"

#include <iostream>
#include <utility>

namespace lan_watch::server
{
    using lan_watch::protocol::Request;
    using lan_watch::protocol::Response;
    using lan_watch::protocol::StatusCode;

    ApiHandler::ApiHandler(const lan_watch::monitor::ViewBuilder &view, TimeSource now)
        : m_view(view), m_now(std::move(now))
    {
    }

    Response ApiHandler::Handle(const Request &req) const
    {
        if (req.method != "GET" && req.method != "HEAD")
        {
            Response resp = lan_watch::protocol::MakeErrorResponse(StatusCode::MethodNotAllowed);
            resp.extra_headers.emplace_back("Allow", "GET, HEAD");
            return resp;
        }

        const std::string path = req.Path();
        if (path == "/api/devices")
            return HandleDevices();
        if (path == "/" || path == "/index.html")
            return HandleDashboard();

        return lan_watch::protocol::MakeErrorResponse(StatusCode::NotFound);
    }

    Response ApiHandler::HandleDevices() const
    {
        Response resp;
        try
        {
            resp.content_type = "application/json";
            resp.body = lan_watch::monitor::SerializeStatus(m_view.Query(m_now()));
        }
        catch (const std::exception &e)
        {
            std::cerr << "[ApiHandler] ERROR: failed to build device list: " << e.what() << "\n";
            return lan_watch::protocol::MakeErrorResponse(StatusCode::InternalServerError);
        }
        return resp;
    }

    Response ApiHandler::HandleDashboard() const
    {
        Response resp;
        resp.content_type = "text/html; charset=utf-8";
        resp.body = DASHBOARD_HTML;
        return resp;
    }
}
