#pragma once

#include <atomic>
#include <condition_variable>
#include <functional>
#include <mutex>
#include <queue>
#include <thread>
#include <vector>

namespace lan_watch::monitor
{
    using ProbeTask = std::function<void()>;

    // Fixed number of worker threads; the thread count is the concurrency cap.
    class ProbePool
    {
    private:
        std::vector<std::thread> m_threads;
        std::mutex m_queue_mutex;
        std::condition_variable m_queue_cv;
        std::condition_variable m_done_cv;
        std::queue<ProbeTask> m_job_queue;
        size_t m_pending;
        size_t m_worker_count;
        std::atomic<bool> m_running;
        std::mutex m_batch_mutex;

        void ProcessLoop();

    public:
        explicit ProbePool(size_t worker_count);
        ~ProbePool();

        ProbePool(const ProbePool &) = delete;
        ProbePool &operator=(const ProbePool &) = delete;

        void Start();
        void Stop();

        // Queues every task and blocks until all of them have finished.
        void RunBatch(std::vector<ProbeTask> tasks);

        size_t WorkerCount() const { return m_worker_count; }
        bool IsRunning() const { return m_running; }
    };
}
