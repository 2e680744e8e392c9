#pragma once

#include <cstddef>
#include <functional>
#include <memory>
#include <tbb/task_arena.h>

/**
 * @brief Fixed-size worker pool backing scan and per-file processing
 *
 * Wraps a tbb::task_arena so that all parallel algorithms launched through
 * execute() are bounded to the configured concurrency without touching the
 * process-wide TBB limits.
 */
class WorkerPool
{
public:
    /**
     * @param num_threads Requested concurrency; 0 selects hardware concurrency.
     *        Out-of-range values are clamped to [MIN_THREADS, MAX_THREADS].
     */
    explicit WorkerPool(size_t num_threads = 0);

    /**
     * @brief Run a callable inside the arena and wait for it
     */
    void execute(const std::function<void()> &work);

    size_t getThreadCount() const { return thread_count_; }

    static size_t defaultThreadCount();
    static bool validateThreadCount(size_t num_threads);

    static constexpr size_t MIN_THREADS = 1;
    static constexpr size_t MAX_THREADS = 64;

private:
    WorkerPool(const WorkerPool &) = delete;
    WorkerPool &operator=(const WorkerPool &) = delete;

    size_t thread_count_;
    std::unique_ptr<tbb::task_arena> arena_;
};
