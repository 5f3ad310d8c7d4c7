#include "charx/util/thread-pool.hh"

#include <gtest/gtest.h>

#include <atomic>
#include <chrono>
#include <thread>

namespace charx {

/* Counts finished work items so tests can wait for them. */
struct Done
{
    Sync<int> count{0};
    std::condition_variable changed;

    void operator++()
    {
        ++*count.lock();
        changed.notify_all();
    }

    void waitFor(int n)
    {
        auto count_(count.lock());
        count_.wait(changed, [&]() { return *count_ >= n; });
    }
};

TEST(threadpool, runsEveryItem)
{
    Done done;
    std::atomic<int> sum{0};
    {
        ThreadPool pool(3);
        for (int i = 1; i <= 20; i++)
            pool.enqueue([&, i] {
                sum += i;
                ++done;
            });
        done.waitFor(20);
    }
    ASSERT_EQ(sum.load(), 210);
}

TEST(threadpool, neverExceedsMaxThreads)
{
    Done done;
    std::atomic<int> running{0}, peak{0};
    ThreadPool pool(2);
    for (int i = 0; i < 16; i++)
        pool.enqueue([&] {
            int now = ++running;
            int prev = peak.load();
            while (now > prev && !peak.compare_exchange_weak(prev, now))
                ;
            std::this_thread::sleep_for(std::chrono::milliseconds(2));
            --running;
            ++done;
        });
    done.waitFor(16);
    ASSERT_LE(peak.load(), 2);
    ASSERT_GE(peak.load(), 1);
}

TEST(threadpool, workItemsMayEnqueueMore)
{
    Done done;
    ThreadPool pool(2);
    pool.enqueue([&] {
        for (int i = 0; i < 5; i++)
            pool.enqueue([&] { ++done; });
        ++done;
    });
    done.waitFor(6);
}

TEST(threadpool, throwingItemDoesNotStopTheWorker)
{
    Done done;
    ThreadPool pool(1);
    pool.enqueue([] { throw Error("disk full"); });
    pool.enqueue([&] { ++done; });
    done.waitFor(1);
}

TEST(threadpool, destructionDropsItemsNotYetStarted)
{
    std::atomic<int> ran{0};
    Sync<bool> release{false};
    std::condition_variable released;
    Done started;
    std::thread opener;
    {
        ThreadPool pool(1);
        pool.enqueue([&] {
            ++started;
            auto release_(release.lock());
            release_.wait(released, [&]() { return *release_; });
            ++ran;
        });
        for (int i = 0; i < 4; i++)
            pool.enqueue([&] { ++ran; });
        started.waitFor(1);

        /* Let the running item finish only once the pool is being
           destroyed. */
        opener = std::thread([&] {
            std::this_thread::sleep_for(std::chrono::milliseconds(50));
            *release.lock() = true;
            released.notify_all();
        });
    }
    opener.join();
    ASSERT_EQ(ran.load(), 1);
}

} // namespace charx
