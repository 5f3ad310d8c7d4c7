#include "charx/util/thread-pool.hh"
#include "charx/util/logging.hh"

#include <system_error>

namespace charx {

ThreadPool::ThreadPool(size_t maxThreads)
    : maxThreads(std::max<size_t>(maxThreads, 1))
{
}

ThreadPool::~ThreadPool()
{
    std::vector<std::thread> workers;
    {
        auto state(state_.lock());
        state->quit = true;
        if (!state->pending.empty())
            debug("dropping %d work items that have not started", state->pending.size());
        state->pending.clear();
        workers.swap(state->workers);
    }
    work.notify_all();
    for (auto & worker : workers)
        worker.join();
}

void ThreadPool::enqueue(work_t item)
{
    auto state(state_.lock());
    if (state->quit)
        throw ThreadPoolShutDown("cannot add work to a thread pool that is shutting down");
    state->pending.push_back(std::move(item));
    if (state->pending.size() > state->idle && state->workers.size() < maxThreads) {
        try {
            state->workers.emplace_back(&ThreadPool::run, this);
        } catch (std::system_error &) {
            /* Without any worker the item would never run. */
            if (state->workers.empty()) {
                state->pending.pop_back();
                throw;
            }
        }
    }
    work.notify_one();
}

void ThreadPool::run()
{
    while (true) {
        work_t item;
        {
            auto state(state_.lock());
            state->idle++;
            state.wait(work, [&]() { return state->quit || !state->pending.empty(); });
            state->idle--;
            if (state->quit)
                return;
            item = std::move(state->pending.front());
            state->pending.pop_front();
        }

        try {
            item();
        } catch (std::exception & e) {
            printError("work item failed: %s", e.what());
        }
    }
}

} // namespace charx
