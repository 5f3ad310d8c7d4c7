#pragma once
///@file

#include "charx/util/error.hh"
#include "charx/util/sync.hh"

#include <condition_variable>
#include <deque>
#include <functional>
#include <thread>
#include <vector>

namespace charx {

MakeError(ThreadPoolShutDown, Error);

/**
 * Runs work items on at most `maxThreads` workers, started as work
 * arrives. Work items report their own failures; an exception that
 * escapes one is logged.
 *
 * Destruction waits for running items and drops those not yet
 * started.
 */
class ThreadPool
{
public:

    typedef std::function<void()> work_t;

    explicit ThreadPool(size_t maxThreads);

    ThreadPool(const ThreadPool &) = delete;

    ~ThreadPool();

    /**
     * @throws ThreadPoolShutDown once destruction has begun.
     */
    void enqueue(work_t item);

private:

    const size_t maxThreads;

    struct State
    {
        std::deque<work_t> pending;
        size_t idle = 0;
        bool quit = false;
        std::vector<std::thread> workers;
    };

    Sync<State> state_;

    std::condition_variable work;

    void run();
};

} // namespace charx
