#pragma once
///@file

#include <condition_variable>
#include <mutex>

namespace charx {

/**
 * A value that can only be reached through a lock:
 *
 *     Sync<std::map<std::string, int>> counts;
 *     {
 *         auto counts_(counts.lock());
 *         (*counts_)["x"]++;
 *     }
 *
 * The mutex is released when the `Lock` goes out of scope.
 */
template<class T>
class Sync
{
    std::mutex mutex;
    T data;

public:

    Sync() {}

    explicit Sync(T data)
        : data(std::move(data))
    {
    }

    class Lock
    {
        T & data;
        std::unique_lock<std::mutex> lk;

        friend Sync;

        Lock(Sync & s)
            : data(s.data)
            , lk(s.mutex)
        {
        }

    public:
        Lock(const Lock &) = delete;

        T * operator->()
        {
            return &data;
        }

        T & operator*()
        {
            return data;
        }

        template<class Predicate>
        void wait(std::condition_variable & cv, Predicate pred)
        {
            cv.wait(lk, pred);
        }
    };

    Lock lock()
    {
        return Lock(*this);
    }
};

} // namespace charx
