#include "HttpServer.hpp"
#include "ApiHandler.hpp"
#include "../common/Ipv4.hpp"
#include "../monitor/CommandProber.hpp"
#include "../monitor/Config.hpp"
#include "../monitor/DeviceRegistry.hpp"
#include "../monitor/IcmpProber.hpp"
#include "../monitor/KnownHosts.hpp"
#include "../monitor/ScanEngine.hpp"
#include "../monitor/ViewBuilder.hpp"

#include <csignal>
#include <iostream>
#include <memory>

namespace
{
    lan_watch::server::HttpServer *g_server = nullptr;

    void HandleSignal(int)
    {
        if (g_server)
            g_server->Stop();
    }

    std::shared_ptr<lan_watch::monitor::Prober> MakeProber(lan_watch::monitor::ProbeMethod method)
    {
        if (method == lan_watch::monitor::ProbeMethod::Command)
            return std::make_shared<lan_watch::monitor::CommandProber>();
        return std::make_shared<lan_watch::monitor::IcmpProber>();
    }
}

int main(int argc, char *argv[])
{
    using namespace lan_watch;

    try
    {
        monitor::Config config = monitor::LoadConfig(argc, argv);
        monitor::PrintConfig(config);

        common::Cidr cidr = common::ParseCidr(config.network_cidr);
        if (common::HostCount(cidr) > 65536)
        {
            std::cerr << "[Main] WARN: " << config.network_cidr << " has " << common::HostCount(cidr)
                      << " hosts; sweeps will be slow\n";
        }

        std::vector<monitor::KnownHost> known_hosts = monitor::LoadKnownHosts(config.known_hosts_file);

        monitor::DeviceRegistry registry;
        registry.SeedStatic(known_hosts, monitor::Clock::now());

        std::vector<std::string> targets = monitor::BuildSweepTargets(common::ExpandHosts(cidr), known_hosts);

        monitor::ScanSettings settings;
        settings.interval = config.scan_interval;
        settings.max_concurrency = config.max_workers;
        settings.probe_timeout = config.probe_timeout;
        settings.forget_after = config.offline_forget;

        monitor::ScanEngine engine(registry, MakeProber(config.probe_method), targets, settings);

        monitor::ViewSettings view_settings;
        view_settings.new_device_window = config.new_device_window;
        monitor::ViewBuilder view(registry, config.network_cidr, view_settings);

        server::ApiHandler api(view);
        server::HttpServer http(config.http_port,
                                [&api](const protocol::Request &req)
                                { return api.Handle(req); },
                                config.tls_cert_file, config.tls_key_file);
        http.Init();

        std::signal(SIGPIPE, SIG_IGN);
        g_server = &http;
        std::signal(SIGINT, HandleSignal);
        std::signal(SIGTERM, HandleSignal);

        engine.Start();
        http.Run();

        std::cout << "[Main] Shutting down scan engine...\n";
        g_server = nullptr;
        engine.Stop();
    }
    catch (const std::exception &e)
    {
        std::cerr << "Fatal Error: " << e.what() << '\n';
        return -1;
    }

    return 0;
}
