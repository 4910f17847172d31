//
// Copyright (c) 2019-2025 Ivan Baidakou (basiliscos) (the dot dmol at gmail dot com)
//
// Distributed under the MIT Software License
//

#include "stator/child.h"
#include <algorithm>

namespace stator {

const char *to_string(child_state_t state) noexcept {
    switch (state) {
    case child_state_t::starting:
        return "starting";
    case child_state_t::running:
        return "running";
    case child_state_t::stopping:
        return "stopping";
    case child_state_t::stopped:
        return "stopped";
    case child_state_t::restarting:
        return "restarting";
    case child_state_t::failed:
        return "failed";
    case child_state_t::permanently_failed:
        return "permanently_failed";
    }
    return "unknown";
}

const char *to_string(health_status_t status) noexcept {
    switch (status) {
    case health_status_t::healthy:
        return "healthy";
    case health_status_t::degraded:
        return "degraded";
    case health_status_t::failed:
        return "failed";
    }
    return "unknown";
}

report_channel_t::report_channel_t(poster_t poster_, handler_t handler_) noexcept
    : poster{std::move(poster_)}, handler{std::move(handler_)} {}

void report_channel_t::report(const child_id_t &id, std::uint64_t generation,
                              const extended_error_ptr_t &ee) noexcept {
    std::weak_ptr<report_channel_t> weak = shared_from_this();
    poster([weak = std::move(weak), id, generation, ee]() {
        if (auto self = weak.lock()) {
            self->dispatch(id, generation, ee);
        }
    });
}

void report_channel_t::dispatch(const child_id_t &id, std::uint64_t generation,
                                const extended_error_ptr_t &ee) noexcept {
    std::lock_guard<std::mutex> lock(mutex);
    if (handler) {
        handler(id, generation, ee);
    }
}

void report_channel_t::close() noexcept {
    std::lock_guard<std::mutex> lock(mutex);
    handler = {};
}

void child_t::terminate() noexcept {}

health_t child_t::health_check() noexcept { return health_t::healthy(); }

void child_t::report_failure(const extended_error_ptr_t &ee) noexcept {
    report_channel_ptr_t target;
    child_id_t target_id;
    std::uint64_t target_generation = 0;
    {
        std::lock_guard<std::mutex> lock(link_mutex);
        target = channel.lock();
        target_id = id;
        target_generation = generation;
    }
    if (target) {
        target->report(target_id, target_generation, ee);
    }
}

void child_t::report_exit() noexcept { report_failure({}); }

void child_t::link(const report_channel_ptr_t &channel_, const child_id_t &id_,
                   std::uint64_t generation_) noexcept {
    std::lock_guard<std::mutex> lock(link_mutex);
    channel = channel_;
    id = id_;
    generation = generation_;
}

void child_t::unlink() noexcept {
    std::lock_guard<std::mutex> lock(link_mutex);
    channel.reset();
}

bool child_descriptor_t::validate() const noexcept {
    if (!factory) {
        return false;
    }
    if (start_timeout.is_negative() || start_timeout.is_not_a_date_time()) {
        return false;
    }
    if (shutdown_timeout.is_negative() || shutdown_timeout.is_not_a_date_time()) {
        return false;
    }
    return backoff.validate();
}

pt::time_duration child_descriptor_t::effective_shutdown_timeout() const noexcept {
    switch (shutdown_policy.kind) {
    case shutdown_kind_t::immediate:
        return pt::time_duration{};
    case shutdown_kind_t::graceful:
        return std::min(shutdown_policy.timeout, shutdown_timeout);
    case shutdown_kind_t::infinity:
        return pt::pos_infin;
    }
    return shutdown_timeout;
}

child_descriptor_builder_t::child_descriptor_builder_t(std::string name, factory_t factory) noexcept {
    descriptor.name = std::move(name);
    descriptor.factory = std::move(factory);
}

} // namespace stator
