#include "thread.pool.hh"
#include "unit.test.macros.hh"

#include <atomic>
#include <chrono>
#include <stdexcept>
#include <string>
#include <thread>
#include <vector>

int
main()
{
    int retval = 1;

    try {
        std::atomic<int> n_done{ 0 };
        std::vector<std::future<int>> results;
        std::future<void> failing;
        std::future<void> slow;

        {
            partsink::ThreadPool pool(4);
            EXPECT_EQ(size_t, pool.n_workers(), 4);

            slow = pool.submit([&n_done] {
                std::this_thread::sleep_for(std::chrono::milliseconds(50));
                ++n_done;
            });

            for (auto i = 0; i < 100; ++i) {
                results.push_back(pool.submit([i, &n_done] {
                    ++n_done;
                    return i * i;
                }));
            }

            failing = pool.submit(
              [] { throw std::runtime_error("request failed"); });

            // queued requests still run after shutdown
            pool.shutdown();
            EXPECT_EQ(size_t, pool.n_queued(), 0);
            EXPECT_THROW(std::runtime_error, (void)pool.submit([] {}));

            // idempotent
            pool.shutdown();
        }

        EXPECT_EQ(int, n_done.load(), 101);
        for (auto i = 0; i < 100; ++i) {
            EXPECT_EQ(int, results[i].get(), i * i);
        }
        slow.get();

        std::string message;
        try {
            failing.get();
        } catch (const std::runtime_error& exc) {
            message = exc.what();
        }
        EXPECT_STR_EQ(message, "request failed");

        retval = 0;
    } catch (const std::exception& exc) {
        LOG_ERROR("Caught exception: ", exc.what());
    }

    return retval;
}
