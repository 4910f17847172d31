#pragma once

//
// Copyright (c) 2019-2025 Ivan Baidakou (basiliscos) (the dot dmol at gmail dot com)
//
// Distributed under the MIT Software License
//

#include "arc.hpp"
#include "forward.hpp"
#include "log.h"
#include <boost/asio.hpp>
#include <atomic>
#include <mutex>

#if defined(_MSC_VER)
#pragma warning(push)
#pragma warning(disable : 4251)
#endif

namespace stator {

namespace asio = boost::asio;

/** \struct health_monitor_t
 *  \brief periodically invokes supervisor children health checks
 *
 * The checks are performed on the worker threads pool with the fixed
 * interval. The monitor keeps the supervisor alive until it is stopped.
 *
 */
struct STATOR_API health_monitor_t : arc_base_t<health_monitor_t> {
    health_monitor_t(asio::io_context &io_context, supervisor_ptr_t supervisor,
                     const pt::time_duration &interval) noexcept;

    /** \brief schedules the first check */
    void start() noexcept;

    /** \brief cancels further checks and releases the supervisor */
    void stop() noexcept;

    /** \brief whether checks are scheduled */
    bool is_running() const noexcept;

    /** \brief amount of performed checks rounds */
    inline std::uint64_t get_rounds() const noexcept { return rounds.load(std::memory_order_relaxed); }

  private:
    void arm() noexcept;
    void on_timer() noexcept;

    mutable std::mutex mutex;
    asio::deadline_timer timer;
    supervisor_ptr_t supervisor;
    pt::time_duration interval;
    bool running = false;
    std::atomic<std::uint64_t> rounds{0};
    logger_t log;
};

/** \brief intrusive pointer for health monitor */
using health_monitor_ptr_t = intrusive_ptr_t<health_monitor_t>;

} // namespace stator

#if defined(_MSC_VER)
#pragma warning(pop)
#endif
