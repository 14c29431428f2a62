#include "ProbePool.hpp"

#include <iostream>
#include <stdexcept>

namespace lan_watch::monitor
{
    ProbePool::ProbePool(size_t worker_count)
        : m_pending(0), m_worker_count(worker_count), m_running(false)
    {
        if (worker_count == 0)
            throw std::invalid_argument("ProbePool needs at least one worker");
    }

    ProbePool::~ProbePool()
    {
        Stop();
    }

    void ProbePool::Start()
    {
        if (m_running)
            return;

        m_running = true;
        m_threads.reserve(m_worker_count);
        for (size_t i = 0; i < m_worker_count; ++i)
        {
            m_threads.emplace_back(&ProbePool::ProcessLoop, this);
        }
    }

    void ProbePool::Stop()
    {
        if (!m_running)
            return;

        {
            std::lock_guard<std::mutex> lock(m_queue_mutex);
            m_running = false;
        }
        m_queue_cv.notify_all();

        for (auto &t : m_threads)
        {
            if (t.joinable())
                t.join();
        }
        m_threads.clear();
    }

    void ProbePool::RunBatch(std::vector<ProbeTask> tasks)
    {
        if (tasks.empty())
            return;
        if (!m_running)
            throw std::runtime_error("ProbePool::RunBatch - Pool not started");

        std::lock_guard<std::mutex> batch_lock(m_batch_mutex);

        {
            std::lock_guard<std::mutex> lock(m_queue_mutex);
            for (auto &task : tasks)
            {
                m_job_queue.push(std::move(task));
            }
            m_pending += tasks.size();
        }
        m_queue_cv.notify_all();

        std::unique_lock<std::mutex> lock(m_queue_mutex);
        m_done_cv.wait(lock, [this]
                       { return m_pending == 0; });
    }

    void ProbePool::ProcessLoop()
    {
        while (true)
        {
            ProbeTask current_job;

            {
                std::unique_lock<std::mutex> lock(m_queue_mutex);

                m_queue_cv.wait(lock, [this]
                                { return !m_job_queue.empty() || !m_running; });

                // Queued work is drained even while stopping so a waiting batch completes.
                if (!m_running && m_job_queue.empty())
                    break;

                current_job = std::move(m_job_queue.front());
                m_job_queue.pop();
            }

            try
            {
                current_job();
            }
            catch (const std::exception &e)
            {
                std::cerr << "[ProbePool] Error processing job: " << e.what() << "\n";
            }
            catch (...)
            {
                std::cerr << "[ProbePool] Error processing job: unknown exception\n";
            }

            {
                std::lock_guard<std::mutex> lock(m_queue_mutex);
                --m_pending;
                if (m_pending == 0)
                    m_done_cv.notify_all();
            }
        }
    }
}
