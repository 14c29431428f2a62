#include <gtest/gtest.h>

#include <atomic>
#include <map>
#include <mutex>
#include <set>
#include <stdexcept>
#include <thread>
#include "../common/Ipv4.hpp"
#include "../monitor/ScanEngine.hpp"

using namespace lan_watch::monitor;
using namespace std::chrono_literals;

namespace
{
    const TimePoint T0 = TimePoint(std::chrono::seconds(1700000000));

    // Answers from a mutable set of online addresses and records what it was asked.
    class FakeProber : public Prober
    {
    public:
        explicit FakeProber(std::set<std::string> online, std::chrono::milliseconds delay = 0ms)
            : m_online(std::move(online)), m_delay(delay), m_in_flight(0), m_peak(0)
        {
        }

        bool Probe(const std::string &ip, std::chrono::milliseconds) override
        {
            int now = ++m_in_flight;
            int prev = m_peak.load();
            while (now > prev && !m_peak.compare_exchange_weak(prev, now))
            {
            }

            if (m_delay.count() > 0)
                std::this_thread::sleep_for(m_delay);

            bool result;
            {
                std::lock_guard<std::mutex> lock(m_mutex);
                ++m_calls[ip];
                result = m_online.count(ip) > 0;
            }

            --m_in_flight;
            return result;
        }

        void SetOnline(std::set<std::string> online)
        {
            std::lock_guard<std::mutex> lock(m_mutex);
            m_online = std::move(online);
        }

        std::map<std::string, int> Calls()
        {
            std::lock_guard<std::mutex> lock(m_mutex);
            return m_calls;
        }

        int Peak() const { return m_peak; }

    private:
        std::mutex m_mutex;
        std::set<std::string> m_online;
        std::map<std::string, int> m_calls;
        std::chrono::milliseconds m_delay;
        std::atomic<int> m_in_flight;
        std::atomic<int> m_peak;
    };

    class ThrowingProber : public Prober
    {
    public:
        bool Probe(const std::string &ip, std::chrono::milliseconds) override
        {
            if (ip == "10.0.0.2")
                throw std::runtime_error("socket failure");
            return true;
        }
    };

    // Test clock the tests advance by hand.
    struct ManualClock
    {
        std::shared_ptr<std::atomic<int64_t>> offset_ms = std::make_shared<std::atomic<int64_t>>(0);

        ClockFunction Function() const
        {
            auto offset = offset_ms;
            return [offset]()
            { return T0 + std::chrono::milliseconds(offset->load()); };
        }

        void Advance(std::chrono::milliseconds d) { *offset_ms += d.count(); }
    };

    KnownHost Static(const std::string &ip, bool required, bool vip = false)
    {
        KnownHost h;
        h.ip = ip;
        h.required = required;
        h.vip = vip;
        return h;
    }

    ScanSettings FastSettings()
    {
        ScanSettings s;
        s.interval = 1s;
        s.max_concurrency = 8;
        s.probe_timeout = 100ms;
        s.forget_after = 300s;
        return s;
    }
}

TEST(ScanEngineTest, RejectsMissingProber)
{
    DeviceRegistry registry;
    std::vector<std::string> targets = {"10.0.0.1"};
    EXPECT_THROW(ScanEngine engine(registry, nullptr, targets, FastSettings()), std::invalid_argument);
}

TEST(ScanEngineTest, SweepTargetsMergeRangeAndStaticHosts)
{
    std::vector<std::string> range = {"10.0.0.1", "10.0.0.2", "10.0.0.10"};
    std::vector<KnownHost> known = {Static("10.0.0.2", true), Static("192.168.5.5", false)};

    auto targets = BuildSweepTargets(range, known);
    EXPECT_EQ(targets, (std::vector<std::string>{"10.0.0.1", "10.0.0.2", "10.0.0.10", "192.168.5.5"}));
}

TEST(ScanEngineTest, EveryTargetProbedExactlyOncePerSweep)
{
    auto targets = lan_watch::common::ExpandHosts(lan_watch::common::ParseCidr("10.0.0.0/27"));
    auto prober = std::make_shared<FakeProber>(std::set<std::string>{"10.0.0.3"});

    DeviceRegistry registry;
    ScanEngine engine(registry, prober, targets, FastSettings());

    SweepStats stats = engine.RunSweep();

    auto calls = prober->Calls();
    ASSERT_EQ(calls.size(), targets.size());
    for (const auto &entry : calls)
    {
        EXPECT_EQ(entry.second, 1) << entry.first;
    }
    EXPECT_EQ(stats.probed, targets.size());
    EXPECT_EQ(stats.online, 1u);
    EXPECT_EQ(stats.discovered, 1u);
    EXPECT_EQ(engine.CompletedSweeps(), 1u);
}

TEST(ScanEngineTest, ConcurrencyCapHolds)
{
    std::vector<std::string> targets;
    for (int i = 1; i <= 100; ++i)
        targets.push_back("10.0.1." + std::to_string(i));

    auto prober = std::make_shared<FakeProber>(std::set<std::string>{}, 5ms);

    ScanSettings settings = FastSettings();
    settings.max_concurrency = 64;

    DeviceRegistry registry;
    ScanEngine engine(registry, prober, targets, settings);
    engine.RunSweep();

    EXPECT_LE(prober->Peak(), 64);
    EXPECT_EQ(prober->Calls().size(), 100u);
}

TEST(ScanEngineTest, BookkeepingSeesEveryProbeResult)
{
    std::vector<std::string> targets;
    std::set<std::string> online;
    for (int i = 1; i <= 130; ++i)
    {
        targets.push_back("10.0.2." + std::to_string(i));
        online.insert("10.0.2." + std::to_string(i));
    }

    auto prober = std::make_shared<FakeProber>(online, 2ms);
    ScanSettings settings = FastSettings();
    settings.max_concurrency = 64;

    DeviceRegistry registry;
    ScanEngine engine(registry, prober, targets, settings);

    SweepStats stats = engine.RunSweep();

    // More targets than workers: the last probes queue behind the first 64, and
    // the baseline must still cover every one of them.
    EXPECT_TRUE(stats.baseline_marked);
    EXPECT_EQ(stats.online, 130u);
    EXPECT_LE(prober->Peak(), 64);
    auto snap = registry.Snapshot();
    ASSERT_EQ(snap.devices.size(), 130u);
    for (const auto &dev : snap.devices)
    {
        EXPECT_TRUE(dev.seen_before_baseline) << dev.ip;
    }
}

TEST(ScanEngineTest, BaselineOnlyOnFirstSweep)
{
    ManualClock clock;
    auto prober = std::make_shared<FakeProber>(std::set<std::string>{"10.0.0.1"});
    DeviceRegistry registry;
    ScanEngine engine(registry, prober, {"10.0.0.1", "10.0.0.9"}, FastSettings(), clock.Function());

    EXPECT_TRUE(engine.RunSweep().baseline_marked);
    EXPECT_EQ(registry.BaselineTime(), T0);

    clock.Advance(30s);
    prober->SetOnline({"10.0.0.1", "10.0.0.9"});
    SweepStats second = engine.RunSweep();

    EXPECT_FALSE(second.baseline_marked);
    EXPECT_EQ(second.discovered, 1u);
    EXPECT_EQ(registry.BaselineTime(), T0);

    auto dev = registry.Find("10.0.0.9");
    ASSERT_TRUE(dev.has_value());
    EXPECT_FALSE(dev->seen_before_baseline);
    EXPECT_EQ(dev->first_seen, T0 + 30s);
}

TEST(ScanEngineTest, StaleDynamicDeviceIsForgotten)
{
    ManualClock clock;
    auto prober = std::make_shared<FakeProber>(std::set<std::string>{"10.0.0.20"});
    DeviceRegistry registry;
    ScanEngine engine(registry, prober, {"10.0.0.20"}, FastSettings(), clock.Function());

    engine.RunSweep();
    ASSERT_TRUE(registry.Find("10.0.0.20").has_value());

    prober->SetOnline({});
    clock.Advance(200s);
    EXPECT_EQ(engine.RunSweep().evicted, 0u);
    EXPECT_TRUE(registry.Find("10.0.0.20").has_value());

    clock.Advance(101s);
    EXPECT_EQ(engine.RunSweep().evicted, 1u);
    EXPECT_FALSE(registry.Find("10.0.0.20").has_value());
}

TEST(ScanEngineTest, StaticDeviceIsNeverForgotten)
{
    ManualClock clock;
    auto prober = std::make_shared<FakeProber>(std::set<std::string>{});
    DeviceRegistry registry;
    registry.SeedStatic({Static("10.0.0.6", false)}, T0);

    ScanEngine engine(registry, prober, {"10.0.0.6"}, FastSettings(), clock.Function());
    engine.RunSweep();
    clock.Advance(std::chrono::hours(48));
    EXPECT_EQ(engine.RunSweep().evicted, 0u);
    EXPECT_TRUE(registry.Find("10.0.0.6").has_value());
}

TEST(ScanEngineTest, ThrowingProbeCountsAsOffline)
{
    DeviceRegistry registry;
    ScanEngine engine(registry, std::make_shared<ThrowingProber>(), {"10.0.0.1", "10.0.0.2", "10.0.0.3"}, FastSettings());

    SweepStats stats = engine.RunSweep();
    EXPECT_EQ(stats.online, 2u);
    EXPECT_FALSE(registry.Find("10.0.0.2").has_value());
    EXPECT_TRUE(registry.Find("10.0.0.3").has_value());
}

TEST(ScanEngineTest, BackgroundLoopSweepsUntilStopped)
{
    auto prober = std::make_shared<FakeProber>(std::set<std::string>{"10.0.0.1"});
    DeviceRegistry registry;
    ScanEngine engine(registry, prober, {"10.0.0.1"}, FastSettings());

    EXPECT_EQ(engine.CurrentState(), ScanState::Idle);
    engine.Start();
    EXPECT_TRUE(engine.IsRunning());

    for (int i = 0; i < 100 && engine.CompletedSweeps() == 0; ++i)
        std::this_thread::sleep_for(20ms);

    engine.Stop();
    EXPECT_GE(engine.CompletedSweeps(), 1u);
    EXPECT_FALSE(engine.IsRunning());
    EXPECT_EQ(engine.CurrentState(), ScanState::Idle);
    EXPECT_TRUE(registry.IsBaselineDone());
}

TEST(ScanEngineTest, StateNames)
{
    EXPECT_STREQ(ToString(ScanState::Idle), "Idle");
    EXPECT_STREQ(ToString(ScanState::Sweeping), "Sweeping");
    EXPECT_STREQ(ToString(ScanState::Bookkeeping), "Bookkeeping");
    EXPECT_STREQ(ToString(ScanState::Sleeping), "Sleeping");
}
