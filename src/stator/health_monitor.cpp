//
// Copyright (c) 2019-2025 Ivan Baidakou (basiliscos) (the dot dmol at gmail dot com)
//
// Distributed under the MIT Software License
//

#include "stator/health_monitor.h"
#include "stator/supervisor.h"

using namespace stator;

health_monitor_t::health_monitor_t(asio::io_context &io_context, supervisor_ptr_t supervisor_,
                                   const pt::time_duration &interval_) noexcept
    : timer{io_context}, supervisor{std::move(supervisor_)}, interval{interval_}, log{get_logger("stator.health")} {}

void health_monitor_t::start() noexcept {
    std::lock_guard<std::mutex> lock(mutex);
    if (running || !supervisor) {
        return;
    }
    running = true;
    LOG_DEBUG(log, "health checks of {} every {}", supervisor->get_identity(), pt::to_simple_string(interval));
    arm();
}

void health_monitor_t::arm() noexcept {
    auto self = intrusive_ptr_t<health_monitor_t>(this);
    timer.expires_from_now(interval);
    timer.async_wait([self = std::move(self)](const boost::system::error_code &ec) {
        if (!ec) {
            self->on_timer();
        }
    });
}

void health_monitor_t::on_timer() noexcept {
    supervisor_ptr_t target;
    {
        std::lock_guard<std::mutex> lock(mutex);
        if (!running) {
            return;
        }
        target = supervisor;
    }
    auto ee = target->check_health();
    rounds.fetch_add(1, std::memory_order_relaxed);
    if (ee) {
        LOG_WARN(log, "health check round of {} failed: {}", target->get_identity(), ee->message());
    }

    std::lock_guard<std::mutex> lock(mutex);
    if (running) {
        arm();
    }
}

void health_monitor_t::stop() noexcept {
    supervisor_ptr_t released;
    {
        std::lock_guard<std::mutex> lock(mutex);
        running = false;
        boost::system::error_code ec;
        timer.cancel(ec);
        released = std::move(supervisor);
    }
    if (released) {
        LOG_DEBUG(log, "health checks of {} have been stopped", released->get_identity());
    }
}

bool health_monitor_t::is_running() const noexcept {
    std::lock_guard<std::mutex> lock(mutex);
    return running;
}
