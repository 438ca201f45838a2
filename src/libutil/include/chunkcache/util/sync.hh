#pragma once
///@file

#include <chrono>
#include <condition_variable>
#include <mutex>

namespace chunkcache {

/**
 * A value that can only be reached through a lock:
 *
 *   Sync<State> state_;
 *
 *   {
 *       auto state(state_.lock());
 *       state->queued += n;
 *   }
 *
 * The mutex is released when the `Lock` goes out of scope. A `Lock`
 * can also wait on a condition variable, releasing the mutex while it
 * sleeps.
 */
template<class T>
class Sync
{
    std::mutex mutex;
    T data;

public:

    Sync() {}

    Sync(const T & data)
        : data(data)
    {
    }

    class Lock
    {
        friend Sync;

        Sync & s;
        std::unique_lock<std::mutex> lk;

        Lock(Sync & s)
            : s(s)
            , lk(s.mutex)
        {
        }

    public:

        Lock(const Lock &) = delete;

        T * operator->()
        {
            return &s.data;
        }

        T & operator*()
        {
            return s.data;
        }

        void wait(std::condition_variable & cv)
        {
            cv.wait(lk);
        }

        template<class Clock, class Duration>
        std::cv_status wait_until(std::condition_variable & cv, const std::chrono::time_point<Clock, Duration> & t)
        {
            return cv.wait_until(lk, t);
        }
    };

    Lock lock()
    {
        return Lock(*this);
    }
};

} // namespace chunkcache
