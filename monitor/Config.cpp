#include "Config.hpp"
#include "../common/Ipv4.hpp"

#include <cstdlib>
#include <iostream>
#include <stdexcept>

namespace lan_watch::monitor
{
    namespace
    {
        long long ParseInteger(const std::string &name, const std::string &value, long long min, long long max)
        {
            size_t consumed = 0;
            long long parsed = 0;
            try
            {
                parsed = std::stoll(value, &consumed);
            }
            catch (const std::exception &)
            {
                throw std::invalid_argument(name + " must be an integer, got '" + value + "'");
            }

            if (consumed != value.size())
                throw std::invalid_argument(name + " must be an integer, got '" + value + "'");
            if (parsed < min || parsed > max)
                throw std::invalid_argument(name + " out of range [" + std::to_string(min) + ", " +
                                            std::to_string(max) + "]: " + value);
            return parsed;
        }

        long long ReadInteger(const EnvLookup &env, const std::string &name, long long fallback, long long min, long long max)
        {
            auto value = env(name);
            if (!value.has_value() || value->empty())
                return fallback;
            return ParseInteger(name, value.value(), min, max);
        }

        std::string ReadString(const EnvLookup &env, const std::string &name, const std::string &fallback)
        {
            auto value = env(name);
            if (!value.has_value() || value->empty())
                return fallback;
            return value.value();
        }
    }

    std::optional<std::string> ProcessEnvironment(const std::string &name)
    {
        const char *value = std::getenv(name.c_str());
        if (value == nullptr)
            return std::nullopt;
        return std::string(value);
    }

    Config LoadConfig(const EnvLookup &env)
    {
        constexpr long long kMaxSeconds = 7 * 24 * 3600;

        Config config;
        config.network_cidr = ReadString(env, "NETWORK_CIDR", config.network_cidr);
        config.known_hosts_file = ReadString(env, "KNOWN_HOSTS_FILE", config.known_hosts_file);
        config.http_port = static_cast<int>(ReadInteger(env, "HTTP_PORT", config.http_port, 1, 65535));

        config.scan_interval = std::chrono::seconds(
            ReadInteger(env, "SCAN_INTERVAL_SECONDS", config.scan_interval.count(), 1, kMaxSeconds));
        config.max_workers = static_cast<size_t>(
            ReadInteger(env, "MAX_WORKERS", static_cast<long long>(config.max_workers), 1, 1024));
        config.probe_timeout = std::chrono::milliseconds(
            ReadInteger(env, "PROBE_TIMEOUT_MS", config.probe_timeout.count(), 1, 60000));
        config.offline_forget = std::chrono::seconds(
            ReadInteger(env, "OFFLINE_FORGET_SECONDS", config.offline_forget.count(), 0, kMaxSeconds));
        config.new_device_window = std::chrono::seconds(
            ReadInteger(env, "NEW_DEVICE_WINDOW_SECONDS", config.new_device_window.count(), 0, kMaxSeconds));

        std::string method = ReadString(env, "PROBE_METHOD", "icmp");
        if (method == "icmp")
            config.probe_method = ProbeMethod::Icmp;
        else if (method == "command")
            config.probe_method = ProbeMethod::Command;
        else
            throw std::invalid_argument("PROBE_METHOD must be 'icmp' or 'command', got '" + method + "'");

        config.tls_cert_file = ReadString(env, "TLS_CERT_FILE", "");
        config.tls_key_file = ReadString(env, "TLS_KEY_FILE", "");
        if (config.tls_cert_file.empty() != config.tls_key_file.empty())
            throw std::invalid_argument("TLS_CERT_FILE and TLS_KEY_FILE must be set together");

        // Fail at startup rather than in the scan thread.
        lan_watch::common::ParseCidr(config.network_cidr);

        return config;
    }

    Config LoadConfig(int argc, char *argv[], const EnvLookup &env)
    {
        Config config = LoadConfig(env);

        if (argc > 2)
            throw std::invalid_argument("Usage: ./lan_watch [HttpPort]");
        if (argc == 2)
            config.http_port = static_cast<int>(ParseInteger("HttpPort", argv[1], 1, 65535));

        return config;
    }

    const char *ToString(ProbeMethod method)
    {
        switch (method)
        {
        case ProbeMethod::Icmp:
            return "icmp";
        case ProbeMethod::Command:
            return "command";
        }
        return "unknown";
    }

    void PrintConfig(const Config &config)
    {
        std::cout << "[Config] network=" << config.network_cidr
                  << " known_hosts=" << config.known_hosts_file
                  << " port=" << config.http_port
                  << " tls=" << (config.TlsEnabled() ? "on" : "off") << "\n";
        std::cout << "[Config] interval=" << config.scan_interval.count() << "s"
                  << " workers=" << config.max_workers
                  << " timeout=" << config.probe_timeout.count() << "ms"
                  << " forget=" << config.offline_forget.count() << "s"
                  << " new_window=" << config.new_device_window.count() << "s"
                  << " probe=" << ToString(config.probe_method) << "\n";
    }
}
