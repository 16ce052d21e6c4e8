#include "macros.hh"
#include "thread.pool.hh"

partsink::ThreadPool::ThreadPool(unsigned int n_workers)
  : stopping_{ false }
{
    EXPECT(n_workers > 0, "A thread pool needs at least one worker.");

    workers_.reserve(n_workers);
    for (auto i = 0u; i < n_workers; ++i) {
        workers_.emplace_back(&ThreadPool::worker_loop_, this);
    }
}

partsink::ThreadPool::~ThreadPool() noexcept
{
    shutdown();
}

void
partsink::ThreadPool::shutdown() noexcept
{
    {
        std::scoped_lock lock(mutex_);
        stopping_ = true;
    }
    cv_.notify_all();

    for (auto& worker : workers_) {
        if (worker.joinable()) {
            worker.join();
        }
    }
}

size_t
partsink::ThreadPool::n_queued() const
{
    std::scoped_lock lock(mutex_);
    return queue_.size();
}

void
partsink::ThreadPool::enqueue_(std::packaged_task<void()>&& task)
{
    {
        std::scoped_lock lock(mutex_);
        EXPECT(!stopping_, "Cannot submit a request to a stopped thread pool");
        queue_.push_back(std::move(task));
    }
    cv_.notify_one();
}

void
partsink::ThreadPool::worker_loop_()
{
    for (;;) {
        std::packaged_task<void()> task;
        {
            std::unique_lock lock(mutex_);
            cv_.wait(lock, [this] { return stopping_ || !queue_.empty(); });

            // drain before stopping
            if (queue_.empty()) {
                return;
            }

            task = std::move(queue_.front());
            queue_.pop_front();
        }

        // exceptions are stored in the request's future
        task();
    }
}
