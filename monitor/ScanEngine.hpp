#pragma once

#include <atomic>
#include <chrono>
#include <cstdint>
#include <functional>
#include <memory>
#include <mutex>
#include <string>
#include <thread>
#include <vector>
#include "DeviceRegistry.hpp"
#include "ProbePool.hpp"
#include "Prober.hpp"

namespace lan_watch::monitor
{
    enum class ScanState
    {
        Idle,
        Sweeping,
        Bookkeeping,
        Sleeping
    };

    const char *ToString(ScanState state);

    struct ScanSettings
    {
        std::chrono::seconds interval{30};
        size_t max_concurrency = 64;
        std::chrono::milliseconds probe_timeout{1000};
        std::chrono::seconds forget_after{300};
    };

    struct SweepStats
    {
        size_t probed = 0;
        size_t online = 0;
        size_t discovered = 0;
        size_t evicted = 0;
        bool baseline_marked = false;
        std::chrono::milliseconds duration{0};
    };

    using ClockFunction = std::function<TimePoint()>;

    // Every CIDR host plus every static address, deduplicated, in numeric order.
    std::vector<std::string> BuildSweepTargets(const std::vector<std::string> &range_hosts,
                                               const std::vector<KnownHost> &known_hosts);

    class ScanEngine
    {
    public:
        ScanEngine(DeviceRegistry &registry,
                   std::shared_ptr<Prober> prober,
                   std::vector<std::string> targets,
                   ScanSettings settings,
                   ClockFunction clock = []
                   { return Clock::now(); });
        ~ScanEngine();

        ScanEngine(const ScanEngine &) = delete;
        ScanEngine &operator=(const ScanEngine &) = delete;

        void Start();
        void Stop();

        // One Sweeping + Bookkeeping pass on the calling thread.
        SweepStats RunSweep();

        bool IsRunning() const { return m_running; }
        ScanState CurrentState() const { return m_state; }
        uint64_t CompletedSweeps() const { return m_completed_sweeps; }
        const std::vector<std::string> &Targets() const { return m_targets; }

    private:
        void ScanLoop();
        void SleepInterval();

        DeviceRegistry &m_registry;
        std::shared_ptr<Prober> m_prober;
        std::vector<std::string> m_targets;
        ScanSettings m_settings;
        ClockFunction m_clock;

        ProbePool m_pool;
        std::mutex m_sweep_mutex;

        std::atomic<bool> m_running;
        std::atomic<ScanState> m_state;
        std::atomic<uint64_t> m_completed_sweeps;
        std::thread m_thread;
    };
}
