#pragma once

#include <condition_variable>
#include <cstddef>
#include <deque>
#include <future>
#include <mutex>
#include <thread>
#include <type_traits>
#include <utility>
#include <vector>

namespace partsink {
/**
 * @brief Runs submitted requests on a fixed set of worker threads.
 *
 * Each request's result, or the exception it throws, is delivered through the
 * future returned by submit(). Requests already queued when the pool shuts
 * down still run, so every future handed out eventually becomes ready.
 */
class ThreadPool
{
  public:
    explicit ThreadPool(unsigned int n_workers);
    ~ThreadPool() noexcept;

    ThreadPool(const ThreadPool&) = delete;
    ThreadPool& operator=(const ThreadPool&) = delete;

    /**
     * @brief Queue @p request to run on a worker.
     * @throws std::runtime_error if the pool has been shut down.
     */
    template<typename F>
    std::future<std::invoke_result_t<F>> submit(F&& request)
    {
        std::packaged_task<std::invoke_result_t<F>()> task(
          std::forward<F>(request));
        auto result = task.get_future();

        enqueue_(std::packaged_task<void()>(
          [task = std::move(task)]() mutable { task(); }));

        return result;
    }

    /**
     * @brief Stop accepting requests, run what is queued and join the
     * workers. Safe to call more than once.
     */
    void shutdown() noexcept;

    size_t n_workers() const noexcept { return workers_.size(); }

    /** @brief Requests queued but not yet picked up by a worker. */
    size_t n_queued() const;

  private:
    std::vector<std::thread> workers_;

    mutable std::mutex mutex_;
    std::condition_variable cv_;
    std::deque<std::packaged_task<void()>> queue_;
    bool stopping_;

    void enqueue_(std::packaged_task<void()>&& task);
    void worker_loop_();
};
} // namespace partsink
