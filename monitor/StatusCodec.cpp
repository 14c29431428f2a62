#include "StatusCodec.hpp"

namespace lan_watch::monitor
{
    namespace
    {
        template <typename T>
        nlohmann::json OptionalToJson(const std::optional<T> &value)
        {
            if (value.has_value())
                return nlohmann::json(value.value());
            return nlohmann::json(nullptr);
        }
    }

    nlohmann::json ToJson(const DisplayDevice &dev)
    {
        using json = nlohmann::json;
        json out;
        out["ip"] = dev.ip;
        out["hostname"] = OptionalToJson(dev.hostname);
        out["required"] = dev.required;
        out["vip"] = dev.vip;
        out["online"] = dev.online;
        out["age_seconds"] = OptionalToJson(dev.age_seconds);
        out["last_seen_seconds_ago"] = OptionalToJson(dev.last_seen_seconds_ago);
        out["is_new"] = dev.is_new;
        return out;
    }

    nlohmann::json ToJson(const NetworkStatus &status)
    {
        using json = nlohmann::json;
        json root;
        root["network"] = status.network;

        json devices = json::array();
        for (const auto &dev : status.devices)
        {
            devices.push_back(ToJson(dev));
        }
        root["devices"] = devices;
        return root;
    }

    std::string SerializeStatus(const NetworkStatus &status)
    {
        // Hostnames come from a hand-edited file and may not be valid UTF-8.
        return ToJson(status).dump(-1, ' ', false, nlohmann::json::error_handler_t::replace);
    }
}
