#pragma once

#include <condition_variable>
#include <cstddef>
#include <mutex>

namespace net_survey::engine
{
    // Counting semaphore bounding in-flight probes across a whole sweep.
    class Semaphore
    {
    private:
        std::size_t m_permits;
        std::mutex m_mutex;
        std::condition_variable m_cv;

    public:
        explicit Semaphore(std::size_t permits) : m_permits(permits) {}

        Semaphore(const Semaphore &) = delete;
        Semaphore &operator=(const Semaphore &) = delete;

        void Acquire()
        {
            std::unique_lock<std::mutex> lock(m_mutex);
            m_cv.wait(lock, [this]
                      { return m_permits > 0; });
            --m_permits;
        }

        void Release()
        {
            std::lock_guard<std::mutex> lock(m_mutex);
            ++m_permits;
            m_cv.notify_one();
        }
    };

    class SemaphoreGuard
    {
    public:
        explicit SemaphoreGuard(Semaphore &sem) : m_sem(sem) { m_sem.Acquire(); }
        ~SemaphoreGuard() { m_sem.Release(); }

        SemaphoreGuard(const SemaphoreGuard &) = delete;
        SemaphoreGuard &operator=(const SemaphoreGuard &) = delete;

    private:
        Semaphore &m_sem;
    };
}
