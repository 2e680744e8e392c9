#include "core/worker_pool.hpp"
#include "logging/logger.hpp"
#include <algorithm>
#include <thread>

WorkerPool::WorkerPool(size_t num_threads)
{
    if (num_threads == 0)
    {
        num_threads = defaultThreadCount();
    }
    else if (!validateThreadCount(num_threads))
    {
        size_t clamped = std::clamp(num_threads, MIN_THREADS, MAX_THREADS);
        Logger::warn("Invalid worker thread count: " + std::to_string(num_threads) +
                     ". Using: " + std::to_string(clamped));
        num_threads = clamped;
    }

    thread_count_ = num_threads;
    arena_ = std::make_unique<tbb::task_arena>(static_cast<int>(thread_count_));
    Logger::info("Worker pool initialized with " + std::to_string(thread_count_) + " threads");
}

void WorkerPool::execute(const std::function<void()> &work)
{
    arena_->execute([&work]()
                    { work(); });
}

size_t WorkerPool::defaultThreadCount()
{
    size_t hardware = std::thread::hardware_concurrency();
    if (hardware == 0)
        hardware = 4;
    return std::clamp(hardware, MIN_THREADS, MAX_THREADS);
}

bool WorkerPool::validateThreadCount(size_t num_threads)
{
    return num_threads >= MIN_THREADS && num_threads <= MAX_THREADS;
}
