#pragma once

//
// Copyright (c) 2019-2025 Ivan Baidakou (basiliscos) (the dot dmol at gmail dot com)
//
// Distributed under the MIT Software License
//

#include "chrono.h"
#include <condition_variable>
#include <future>
#include <memory>
#include <mutex>
#include <optional>
#include <system_error>
#include <thread>
#include <type_traits>

namespace stator::detail {

/** \struct call_tracker_t
 *  \brief tracks bounded calls of a single child instance
 *
 * The bounded call might outlive its timeout; until it completes, the
 * tracker is busy, and no other call should be made on the instance.
 *
 */
struct call_tracker_t {
    /** \brief whether the previous call is still in progress */
    bool busy() const noexcept {
        std::lock_guard<std::mutex> lock(mutex);
        return active;
    }

    /** \brief waits at most `timeout` until the previous call completes */
    bool wait_idle(const pt::time_duration &timeout) noexcept {
        std::unique_lock<std::mutex> lock(mutex);
        if (is_unbounded(timeout)) {
            idle.wait(lock, [this]() { return !active; });
            return true;
        }
        return idle.wait_for(lock, to_chrono(timeout), [this]() { return !active; });
    }

    /** \brief marks the tracker busy */
    void acquire() noexcept {
        std::lock_guard<std::mutex> lock(mutex);
        active = true;
    }

    /** \brief marks the tracker idle and wakes up the waiters */
    void release() noexcept {
        {
            std::lock_guard<std::mutex> lock(mutex);
            active = false;
        }
        idle.notify_all();
    }

  private:
    mutable std::mutex mutex;
    std::condition_variable idle;
    bool active = false;
};

/** \brief shared pointer to the call tracker */
using call_tracker_ptr_t = std::shared_ptr<call_tracker_t>;

/** \brief invokes `fn` and waits its result at most `timeout`
 *
 * Bounded calls are performed on the dedicated thread, which is left
 * behind if the timeout elapses; the `fn` must keep alive all objects
 * it refers to (i.e. capture intrusive pointers). The `tracker` stays
 * busy until the call actually completes, so the caller must check it
 * before making another call on the same instance.
 *
 * The empty optional is returned on timeout.
 *
 */
template <typename Fn, typename R = std::invoke_result_t<Fn>>
std::optional<R> timed_call(const pt::time_duration &timeout, const call_tracker_ptr_t &tracker, Fn &&fn) noexcept {
    if (is_unbounded(timeout)) {
        return fn();
    }
    auto promise = std::make_shared<std::promise<R>>();
    auto future = promise->get_future();
    tracker->acquire();
    try {
        std::thread([promise, tracker, fn = std::forward<Fn>(fn)]() mutable {
            promise->set_value(fn());
            tracker->release();
        }).detach();
    } catch (const std::system_error &) {
        tracker->release();
        return {};
    }
    if (future.wait_for(to_chrono(timeout)) != std::future_status::ready) {
        return {};
    }
    return future.get();
}

} // namespace stator::detail
