#pragma once

#include <string>
#include <nlohmann/json.hpp>
#include "ViewBuilder.hpp"

namespace lan_watch::monitor
{
    nlohmann::json ToJson(const DisplayDevice &dev);
    nlohmann::json ToJson(const NetworkStatus &status);

    std::string SerializeStatus(const NetworkStatus &status);
}
