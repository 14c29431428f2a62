#pragma once

#include <chrono>
#include <functional>
#include <optional>
#include <string>

namespace lan_watch::monitor
{
    enum class ProbeMethod
    {
        Icmp,
        Command
    };

    struct Config
    {
        std::string network_cidr = "192.168.178.0/24";
        std::string known_hosts_file = "known_hosts.txt";
        int http_port = 8000;

        std::chrono::seconds scan_interval{30};
        size_t max_workers = 64;
        std::chrono::milliseconds probe_timeout{1000};
        std::chrono::seconds offline_forget{300};
        std::chrono::seconds new_device_window{300};
        ProbeMethod probe_method = ProbeMethod::Icmp;

        std::string tls_cert_file;
        std::string tls_key_file;

        bool TlsEnabled() const { return !tls_cert_file.empty(); }
    };

    using EnvLookup = std::function<std::optional<std::string>(const std::string &)>;

    std::optional<std::string> ProcessEnvironment(const std::string &name);

    // Throws std::invalid_argument naming the offending variable.
    Config LoadConfig(const EnvLookup &env);

    // Environment first, then "[HttpPort]" from the command line.
    Config LoadConfig(int argc, char *argv[], const EnvLookup &env = ProcessEnvironment);

    const char *ToString(ProbeMethod method);

    void PrintConfig(const Config &config);
}
