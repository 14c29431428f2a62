#include "ScanEngine.hpp"
#include "../common/Ipv4.hpp"

#include <algorithm>
#include <iostream>
#include <set>
#include <stdexcept>
#include <utility>

namespace lan_watch::monitor
{
    const char *ToString(ScanState state)
    {
        switch (state)
        {
        case ScanState::Idle:
            return "Idle";
        case ScanState::Sweeping:
            return "Sweeping";
        case ScanState::Bookkeeping:
            return "Bookkeeping";
        case ScanState::Sleeping:
            return "Sleeping";
        }
        return "Unknown";
    }

    std::vector<std::string> BuildSweepTargets(const std::vector<std::string> &range_hosts,
                                               const std::vector<KnownHost> &known_hosts)
    {
        std::set<std::string> host_set(range_hosts.begin(), range_hosts.end());
        for (const auto &h : known_hosts)
        {
            host_set.insert(h.ip);
        }

        std::vector<std::string> targets(host_set.begin(), host_set.end());
        std::sort(targets.begin(), targets.end(), lan_watch::common::AddressLess);
        return targets;
    }

    ScanEngine::ScanEngine(DeviceRegistry &registry,
                           std::shared_ptr<Prober> prober,
                           std::vector<std::string> targets,
                           ScanSettings settings,
                           ClockFunction clock)
        : m_registry(registry),
          m_prober(std::move(prober)),
          m_targets(std::move(targets)),
          m_settings(settings),
          m_clock(std::move(clock)),
          m_pool(settings.max_concurrency),
          m_running(false),
          m_state(ScanState::Idle),
          m_completed_sweeps(0)
    {
        if (!m_prober)
            throw std::invalid_argument("ScanEngine requires a prober");
        if (!m_clock)
            throw std::invalid_argument("ScanEngine requires a clock");
    }

    ScanEngine::~ScanEngine()
    {
        Stop();
    }

    void ScanEngine::Start()
    {
        if (m_running)
            return;
        m_running = true;
        m_thread = std::thread(&ScanEngine::ScanLoop, this);
    }

    void ScanEngine::Stop()
    {
        m_running = false;
        if (m_thread.joinable())
            m_thread.join();
        m_pool.Stop();
        m_state = ScanState::Idle;
    }

    SweepStats ScanEngine::RunSweep()
    {
        std::lock_guard<std::mutex> lock(m_sweep_mutex);

        if (!m_pool.IsRunning())
            m_pool.Start();

        SweepStats stats;
        auto started = std::chrono::steady_clock::now();

        m_state = ScanState::Sweeping;

        std::atomic<size_t> online_count(0);
        std::atomic<size_t> discovered_count(0);

        std::vector<ProbeTask> tasks;
        tasks.reserve(m_targets.size());
        for (const auto &ip : m_targets)
        {
            tasks.emplace_back([this, &ip, &online_count, &discovered_count]()
                               {
                bool ok = false;
                try
                {
                    ok = m_prober->Probe(ip, m_settings.probe_timeout);
                }
                catch (const std::exception &e)
                {
                    std::cerr << "[ScanEngine] Probe of " << ip << " threw: " << e.what() << "\n";
                    ok = false;
                }

                if (ok)
                    ++online_count;

                if (m_registry.UpsertProbeResult(ip, ok, m_clock()) == UpsertOutcome::Discovered)
                {
                    ++discovered_count;
                    std::cout << "[ScanEngine] New device discovered: " << ip << "\n";
                } });
        }

        // Fan-in: RunBatch returns only once every probe of this sweep resolved.
        m_pool.RunBatch(std::move(tasks));

        m_state = ScanState::Bookkeeping;

        TimePoint now = m_clock();
        if (m_registry.MarkBaselineIfFirstSweep(now))
        {
            stats.baseline_marked = true;
            std::cout << "[ScanEngine] Baseline captured with " << m_registry.Size() << " device(s)\n";
        }

        std::vector<std::string> evicted = m_registry.EvictStale(now, m_settings.forget_after);
        for (const auto &ip : evicted)
        {
            std::cout << "[ScanEngine] Forgetting stale device " << ip << "\n";
        }

        stats.probed = m_targets.size();
        stats.online = online_count;
        stats.discovered = discovered_count;
        stats.evicted = evicted.size();
        stats.duration = std::chrono::duration_cast<std::chrono::milliseconds>(std::chrono::steady_clock::now() - started);

        uint64_t sweep_no = ++m_completed_sweeps;
        std::cout << "[ScanEngine] Sweep " << sweep_no << " complete: " << stats.online << "/" << stats.probed
                  << " online, " << stats.evicted << " evicted (" << stats.duration.count() << " ms)\n";

        return stats;
    }

    void ScanEngine::ScanLoop()
    {
        std::cout << "[ScanEngine] Sweeping " << m_targets.size() << " address(es) every "
                  << m_settings.interval.count() << "s with up to " << m_settings.max_concurrency
                  << " concurrent probes\n";

        while (m_running)
        {
            try
            {
                RunSweep();
            }
            catch (const std::exception &e)
            {
                std::cerr << "[ScanEngine] ERROR: sweep aborted: " << e.what() << "\n";
            }

            if (!m_running)
                break;

            m_state = ScanState::Sleeping;
            SleepInterval();
        }

        m_state = ScanState::Idle;
    }

    void ScanEngine::SleepInterval()
    {
        const auto step = std::chrono::milliseconds(100);
        const auto deadline = std::chrono::steady_clock::now() + m_settings.interval;

        while (m_running && std::chrono::steady_clock::now() < deadline)
        {
            std::this_thread::sleep_for(step);
        }
    }
}
