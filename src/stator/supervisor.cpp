//
// Copyright (c) 2019-2025 Ivan Baidakou (basiliscos) (the dot dmol at gmail dot com)
//
// Distributed under the MIT Software License
//

#include "stator/supervisor.h"
#include "stator/system_context.h"
#include "stator/error_code.h"
#include "stator/detail/timed_call.h"
#include <boost/uuid/uuid_io.hpp>
#include <algorithm>

using namespace stator;

namespace {

std::string stringify(const child_id_t &id) noexcept { return boost::uuids::to_string(id); }

} // namespace

bool supervisor_config_builder_t::validate() const noexcept {
    if (config.health) {
        auto &health = *config.health;
        if (health.interval.is_negative() || health.interval == pt::time_duration{}) {
            return false;
        }
        if (health.check_timeout.is_negative() || !health.failure_threshold) {
            return false;
        }
    }
    return true;
}

supervisor_ptr_t supervisor_config_builder_t::finish() && {
    if (!validate()) {
        return {};
    }
    auto supervisor = supervisor_ptr_t(new supervisor_t(system_context, config));
    auto ee = supervisor->start();
    if (ee) {
        system_context.on_error(ee);
        return {};
    }
    return supervisor;
}

supervisor_t::supervisor_t(system_context_t &system_context_, const supervisor_config_t &config_) noexcept
    : system_context{system_context_}, config{config_}, id{make_uuid()}, log{get_logger("stator.supervisor")} {
    if (!config.monitor) {
        config.monitor = new null_monitor_t<supervision_event_t>();
    }
    auto &io_context = system_context.get_io_context();
    channel = std::make_shared<report_channel_t>(
        [&io_context](std::function<void()> fn) { asio::post(io_context, std::move(fn)); },
        [this](const child_id_t &child_id, std::uint64_t generation, const extended_error_ptr_t &reason) {
            on_report(child_id, generation, reason);
        });
}

supervisor_t::~supervisor_t() {
    channel->close();
    stop_health_monitor();
    std::size_t left = 0;
    for (auto &it : entries) {
        auto &instance = it.second.handle.instance;
        if (instance) {
            instance->unlink();
            instance->terminate();
            ++left;
        }
    }
    if (left) {
        LOG_WARN(log, "{} has been destroyed with {} running child(ren), terminated", config.identity, left);
    }
}

void supervisor_t::emit(supervision_event_kind_t kind, const child_id_t *child_id, metadata_t metadata) noexcept {
    supervision_event_t event{utc_now(), boost::uuids::to_string(id), {}, kind, std::move(metadata)};
    if (child_id) {
        event.child_id = stringify(*child_id);
    }
    config.monitor->record(event);
}

void supervisor_t::start_health_monitor() noexcept {
    if (!config.health) {
        return;
    }
    std::lock_guard<std::mutex> lock(health_mutex);
    if (health_monitor && health_monitor->is_running()) {
        return;
    }
    health_monitor = new health_monitor_t(system_context.get_io_context(), supervisor_ptr_t(this),
                                          config.health->interval);
    health_monitor->start();
}

void supervisor_t::stop_health_monitor() noexcept {
    health_monitor_ptr_t monitor;
    {
        std::lock_guard<std::mutex> lock(health_mutex);
        monitor = std::move(health_monitor);
    }
    if (monitor) {
        monitor->stop();
    }
}

extended_error_ptr_t supervisor_t::spawn(entry_t &entry) noexcept {
    auto &handle = entry.handle;
    auto &descriptor = entry.descriptor;
    handle.state = child_state_t::starting;

    child_ptr_t instance;
    extended_error_ptr_t ee;
    try {
        instance = descriptor.factory();
    } catch (const std::exception &ex) {
        ee = make_error(descriptor.name, supervision_code_t::child_start_failed,
                        make_error(ex.what(), supervision_code_t::child_start_failed));
    }
    if (!ee && !instance) {
        ee = make_error(descriptor.name, supervision_code_t::child_start_failed);
    }

    if (!ee) {
        handle.generation = ++generations;
        entry.calls = std::make_shared<detail::call_tracker_t>();
        instance->link(channel, handle.id, handle.generation);
        auto result =
            detail::timed_call(descriptor.start_timeout, entry.calls, [instance]() { return instance->start(); });
        if (!result) {
            instance->unlink();
            instance->terminate();
            auto context = descriptor.name + " (start timeout " + pt::to_simple_string(descriptor.start_timeout) + ")";
            ee = make_error(context, supervision_code_t::child_start_failed);
        } else if (*result) {
            instance->unlink();
            ee = make_error(descriptor.name, supervision_code_t::child_start_failed, *result);
        }
    }

    if (ee) {
        handle.state = child_state_t::failed;
        LOG_ERROR(log, "{}: cannot start {}: {}", config.identity, descriptor.name, ee->message());
        emit(supervision_event_kind_t::failed, &handle.id, {{"name", descriptor.name}, {"error", ee->message()}});
        return ee;
    }

    handle.instance = std::move(instance);
    handle.state = child_state_t::running;
    handle.start_time = utc_now();
    entry.health = health_t::healthy();
    LOG_DEBUG(log, "{}: {} ({}) has been started", config.identity, descriptor.name, stringify(handle.id));
    emit(supervision_event_kind_t::started, &handle.id, {{"name", descriptor.name}});
    return {};
}

extended_error_ptr_t supervisor_t::halt(entry_t &entry) noexcept {
    auto &handle = entry.handle;
    auto &descriptor = entry.descriptor;
    auto instance = std::move(handle.instance);
    if (!instance) {
        handle.state = child_state_t::stopped;
        return {};
    }

    handle.state = child_state_t::stopping;
    instance->unlink();
    extended_error_ptr_t ee;
    if (descriptor.shutdown_policy.kind == shutdown_kind_t::immediate) {
        instance->terminate();
    } else {
        auto timeout = descriptor.effective_shutdown_timeout();
        auto calls = std::move(entry.calls);
        std::optional<extended_error_ptr_t> result;
        if (calls && !calls->wait_idle(timeout)) {
            LOG_WARN(log, "{}: {} is still busy with the previous call", config.identity, descriptor.name);
        } else {
            result = detail::timed_call(timeout, calls, [instance, timeout]() { return instance->stop(timeout); });
        }
        if (!result) {
            instance->terminate();
            ee = make_error(descriptor.name, supervision_code_t::shutdown_timeout);
        } else if (*result) {
            instance->terminate();
            ee = make_error(descriptor.name, supervision_code_t::child_stop_failed, *result);
        }
    }
    handle.state = child_state_t::stopped;

    metadata_t metadata{{"name", descriptor.name}};
    if (ee) {
        metadata["error"] = ee->message();
        LOG_WARN(log, "{}: {} has been stopped abnormally: {}", config.identity, descriptor.name, ee->message());
    } else {
        LOG_DEBUG(log, "{}: {} has been stopped", config.identity, descriptor.name);
    }
    emit(supervision_event_kind_t::stopped, &handle.id, std::move(metadata));
    return ee;
}

void supervisor_t::forget(const child_id_t &child_id) noexcept {
    entries.erase(child_id);
    order.erase(std::remove(order.begin(), order.end(), child_id), order.end());
}

extended_error_ptr_t supervisor_t::start_child(const child_descriptor_t &descriptor, child_id_t &child_id) noexcept {
    if (!descriptor.validate()) {
        LOG_ERROR(log, "{}: invalid descriptor of {}", config.identity, descriptor.name);
        return make_error(descriptor.name, supervision_code_t::child_start_failed);
    }
    lock_t lock(mutex);
    if (state != state_t::running) {
        return make_error(config.identity, supervision_code_t::supervisor_shutting_down);
    }
    entry_t entry{descriptor, child_handle_t{}, backoff_t(descriptor.backoff), health_t{}, 0};
    entry.handle.id = make_uuid();
    auto ee = spawn(entry);
    if (ee) {
        return ee;
    }
    auto new_id = entry.handle.id;
    entries.emplace(new_id, std::move(entry));
    order.push_back(new_id);
    child_id = new_id;
    return {};
}

extended_error_ptr_t supervisor_t::stop_child(const child_id_t &child_id) noexcept {
    lock_t lock(mutex);
    auto it = entries.find(child_id);
    if (it == entries.end()) {
        return make_error(stringify(child_id), supervision_code_t::child_not_found);
    }
    auto ee = halt(it->second);
    forget(child_id);
    return ee;
}

extended_error_ptr_t supervisor_t::restart_child(const child_id_t &child_id) noexcept {
    lock_t lock(mutex);
    if (state != state_t::running) {
        return make_error(config.identity, supervision_code_t::supervisor_shutting_down);
    }
    auto it = entries.find(child_id);
    if (it == entries.end()) {
        return make_error(stringify(child_id), supervision_code_t::child_not_found);
    }
    auto &entry = it->second;
    auto &handle = entry.handle;
    auto now = utc_now();
    if (!entry.backoff.should_restart(now)) {
        LOG_WARN(log, "{}: manual restart of {} denied, restart budget is exhausted", config.identity,
                 entry.descriptor.name);
        return make_error(entry.descriptor.name, supervision_code_t::restart_limit_exceeded);
    }
    auto delay = entry.backoff.record_restart(now);
    halt(entry);
    handle.state = child_state_t::restarting;
    if (delay > pt::time_duration{}) {
        schedule_restart(ids_t{child_id}, delay);
        return {};
    }
    return revive(child_id, entry);
}

extended_error_ptr_t supervisor_t::handle_child_failure(const child_id_t &child_id,
                                                        const extended_error_ptr_t &reason) noexcept {
    lock_t lock(mutex);
    return do_terminated(child_id, reason, true);
}

extended_error_ptr_t supervisor_t::handle_child_exit(const child_id_t &child_id) noexcept {
    lock_t lock(mutex);
    return do_terminated(child_id, {}, false);
}

void supervisor_t::on_report(const child_id_t &child_id, std::uint64_t generation,
                             const extended_error_ptr_t &reason) noexcept {
    lock_t lock(mutex);
    if (state != state_t::running) {
        return;
    }
    auto it = entries.find(child_id);
    if (it == entries.end() || it->second.handle.generation != generation ||
        it->second.handle.state != child_state_t::running) {
        LOG_DEBUG(log, "{}: outdated report from {} is ignored", config.identity, stringify(child_id));
        return;
    }
    auto ee = do_terminated(child_id, reason, static_cast<bool>(reason));
    if (ee) {
        LOG_WARN(log, "{}: child termination handling: {}", config.identity, ee->message());
    }
}

extended_error_ptr_t supervisor_t::do_terminated(const child_id_t &child_id, const extended_error_ptr_t &reason,
                                                 bool abnormal) noexcept {
    if (state != state_t::running) {
        return make_error(config.identity, supervision_code_t::supervisor_shutting_down);
    }
    auto it = entries.find(child_id);
    if (it == entries.end()) {
        return make_error(stringify(child_id), supervision_code_t::child_not_found);
    }
    auto &entry = it->second;
    auto &handle = entry.handle;
    auto &name = entry.descriptor.name;
    if (handle.state == child_state_t::permanently_failed) {
        return make_error(name, supervision_code_t::restart_limit_exceeded, reason);
    }

    if (abnormal) {
        handle.state = child_state_t::failed;
        auto message = reason ? reason->message() : std::string("unknown failure");
        LOG_WARN(log, "{}: {} has failed: {}", config.identity, name, message);
        emit(supervision_event_kind_t::failed, &child_id,
             {{"name", name}, {"error", message}, {"restart_count", std::to_string(handle.restart_count)}});
    } else {
        LOG_DEBUG(log, "{}: {} has exited", config.identity, name);
    }

    if (!should_restart(entry.descriptor.restart_policy, abnormal)) {
        auto ee = halt(entry);
        forget(child_id);
        return ee;
    }
    return do_recover(child_id, reason);
}

extended_error_ptr_t supervisor_t::give_up(const child_id_t &child_id, entry_t &entry,
                                           const extended_error_ptr_t &reason) noexcept {
    auto &name = entry.descriptor.name;
    auto &backoff_config = entry.backoff.get_config();
    halt(entry);
    entry.handle.state = child_state_t::permanently_failed;
    LOG_ERROR(log, "{}: {} has exhausted restart budget ({} restarts in {})", config.identity, name,
              backoff_config.max_restarts, pt::to_simple_string(backoff_config.window));
    emit(supervision_event_kind_t::limit_exceeded, &child_id,
         {{"name", name},
          {"max_restarts", std::to_string(backoff_config.max_restarts)},
          {"window", pt::to_simple_string(backoff_config.window)}});
    return make_error(name, supervision_code_t::restart_limit_exceeded, reason);
}

extended_error_ptr_t supervisor_t::do_recover(const child_id_t &failed_id,
                                              const extended_error_ptr_t &reason) noexcept {
    auto affected = restart_set(config.strategy, failed_id, order);
    emit(supervision_event_kind_t::strategy_applied, &failed_id,
         {{"strategy", to_string(config.strategy)}, {"affected", std::to_string(affected.size())}});

    // children, which are already waiting for restart, have been accounted by their backoff
    auto now = utc_now();
    auto delay = pt::time_duration{};
    extended_error_ptr_t r;
    extended_error_ptr_t exhausted;
    ids_t restarting;
    for (auto it = affected.rbegin(); it != affected.rend(); ++it) {
        auto &child_id = *it;
        auto &entry = entries.find(child_id)->second;
        auto &handle = entry.handle;
        if (handle.state == child_state_t::permanently_failed) {
            continue;
        }
        if (child_id != failed_id && entry.descriptor.restart_policy == restart_policy_t::temporary) {
            halt(entry);
            forget(child_id);
            continue;
        }
        if (handle.state != child_state_t::restarting) {
            if (!entry.backoff.should_restart(now)) {
                auto ee = give_up(child_id, entry, child_id == failed_id ? reason : extended_error_ptr_t{});
                if (child_id == failed_id) {
                    r = ee;
                }
                if (!exhausted) {
                    exhausted = ee;
                }
                continue;
            }
            delay = std::max(delay, entry.backoff.record_restart(now));
            halt(entry);
        }
        handle.state = child_state_t::restarting;
        restarting.push_back(child_id);
    }
    std::reverse(restarting.begin(), restarting.end());

    if (exhausted && config.escalate_failure) {
        LOG_WARN(log, "{}: escalating failure of {}", config.identity, exhausted->context);
        report_failure(make_error(config.identity, supervision_code_t::escalated_failure, exhausted));
    }

    if (!restarting.empty()) {
        if (delay > pt::time_duration{}) {
            LOG_DEBUG(log, "{}: {} child(ren) will be restarted in {}", config.identity, restarting.size(),
                      pt::to_simple_string(delay));
            schedule_restart(restarting, delay);
        } else {
            auto ee = respawn(restarting);
            if (ee && !r) {
                r = ee;
            }
        }
    }
    return r;
}

extended_error_ptr_t supervisor_t::revive(const child_id_t &child_id, entry_t &entry) noexcept {
    auto &handle = entry.handle;
    ++handle.restart_count;
    handle.last_restart = utc_now();
    entry.health_failures = 0;
    auto ee = spawn(entry);
    if (ee) {
        return ee;
    }
    LOG_INFO(log, "{}: {} has been restarted ({})", config.identity, entry.descriptor.name, handle.restart_count);
    emit(supervision_event_kind_t::restarted, &child_id,
         {{"name", entry.descriptor.name}, {"restart_count", std::to_string(handle.restart_count)}});
    return {};
}

extended_error_ptr_t supervisor_t::respawn(const ids_t &ids) noexcept {
    for (auto &child_id : ids) {
        auto it = entries.find(child_id);
        if (it == entries.end() || it->second.handle.state != child_state_t::restarting) {
            continue;
        }
        auto ee = revive(child_id, it->second);
        if (ee) {
            return do_recover(child_id, ee);
        }
    }
    return {};
}

void supervisor_t::schedule_restart(const ids_t &ids, const pt::time_duration &delay) noexcept {
    auto ticket = ++restart_tickets;
    for (auto &child_id : ids) {
        entries.find(child_id)->second.restart_ticket = ticket;
    }
    auto timer = std::make_unique<asio::deadline_timer>(system_context.get_io_context());
    timer->expires_from_now(delay);
    timer->async_wait([self = supervisor_ptr_t(this), ticket, ids](const boost::system::error_code &ec) {
        self->on_restart_timer(ticket, ids, ec);
    });
    timers.emplace(ticket, std::move(timer));
}

void supervisor_t::on_restart_timer(std::uint64_t ticket, const ids_t &ids,
                                    const boost::system::error_code &ec) noexcept {
    lock_t lock(mutex);
    timers.erase(ticket);
    if (ec || state != state_t::running) {
        return;
    }
    ids_t due;
    for (auto &child_id : ids) {
        auto it = entries.find(child_id);
        if (it != entries.end() && it->second.restart_ticket == ticket &&
            it->second.handle.state == child_state_t::restarting) {
            due.push_back(child_id);
        }
    }
    auto ee = respawn(due);
    if (ee) {
        LOG_WARN(log, "{}: delayed restart: {}", config.identity, ee->message());
    }
}

void supervisor_t::cancel_restarts() noexcept {
    for (auto &it : timers) {
        boost::system::error_code ec;
        it.second->cancel(ec);
    }
    timers.clear();
}

extended_error_ptr_t supervisor_t::do_stop_children(bool forget_all) noexcept {
    extended_error_ptr_t r;
    for (auto it = order.rbegin(); it != order.rend(); ++it) {
        auto entry = entries.find(*it);
        if (entry == entries.end()) {
            continue;
        }
        auto was_permanently_failed = entry->second.handle.state == child_state_t::permanently_failed;
        auto ee = halt(entry->second);
        if (was_permanently_failed) {
            entry->second.handle.state = child_state_t::permanently_failed;
        }
        if (ee && !r) {
            r = ee;
        }
    }
    if (forget_all) {
        entries.clear();
        order.clear();
    }
    return r;
}

extended_error_ptr_t supervisor_t::shutdown() noexcept {
    stop_health_monitor();
    lock_t lock(mutex);
    if (state == state_t::stopped && entries.empty()) {
        return {};
    }
    LOG_DEBUG(log, "{}: shutting down {} child(ren)", config.identity, order.size());
    state = state_t::shutting_down;
    cancel_restarts();
    auto ee = do_stop_children(true);
    state = state_t::stopped;
    emit(supervision_event_kind_t::stopped, nullptr, {{"name", config.identity}});
    if (ee) {
        LOG_WARN(log, "{}: has been shut down with error: {}", config.identity, ee->message());
    } else {
        LOG_INFO(log, "{}: has been shut down", config.identity);
    }
    return ee;
}

extended_error_ptr_t supervisor_t::start() noexcept {
    {
        lock_t lock(mutex);
        if (state == state_t::shutting_down) {
            return make_error(config.identity, supervision_code_t::supervisor_shutting_down);
        }
        if (state == state_t::stopped) {
            state = state_t::running;
            extended_error_ptr_t r;
            for (auto &child_id : order) {
                auto &entry = entries.find(child_id)->second;
                entry.backoff.reset();
                entry.health = health_t::healthy();
                entry.health_failures = 0;
                auto ee = spawn(entry);
                if (ee) {
                    r = make_error(config.identity, supervision_code_t::child_start_failed, ee);
                    break;
                }
            }
            if (r) {
                state = state_t::shutting_down;
                do_stop_children(false);
                state = state_t::stopped;
                return r;
            }
            LOG_INFO(log, "{}: has been (re)started with {} child(ren)", config.identity, order.size());
        }
    }
    start_health_monitor();
    return {};
}

extended_error_ptr_t supervisor_t::stop(const pt::time_duration &) noexcept {
    stop_health_monitor();
    lock_t lock(mutex);
    if (state == state_t::stopped) {
        return {};
    }
    state = state_t::shutting_down;
    cancel_restarts();
    auto ee = do_stop_children(false);
    state = state_t::stopped;
    LOG_DEBUG(log, "{}: has been stopped", config.identity);
    return ee;
}

void supervisor_t::terminate() noexcept {
    stop_health_monitor();
    lock_t lock(mutex, std::try_to_lock);
    if (!lock.owns_lock()) {
        LOG_WARN(log, "{}: is busy, cannot be terminated", config.identity);
        return;
    }
    for (auto it = order.rbegin(); it != order.rend(); ++it) {
        auto &handle = entries.find(*it)->second.handle;
        if (handle.instance) {
            handle.instance->unlink();
            handle.instance->terminate();
            handle.instance.reset();
            handle.state = child_state_t::stopped;
        }
    }
    cancel_restarts();
    state = state_t::stopped;
    LOG_WARN(log, "{}: has been terminated", config.identity);
}

health_t supervisor_t::health_check() noexcept {
    lock_t lock(mutex, std::try_to_lock);
    if (!lock.owns_lock()) {
        return health_t::degraded("supervisor is busy");
    }
    if (state != state_t::running) {
        return health_t::failed("supervisor is not running");
    }
    std::size_t broken = 0;
    for (auto &it : entries) {
        auto child_state = it.second.handle.state;
        if (child_state == child_state_t::permanently_failed || child_state == child_state_t::failed) {
            ++broken;
        }
    }
    if (broken) {
        return health_t::degraded(std::to_string(broken) + " child(ren) failed");
    }
    return health_t::healthy();
}

extended_error_ptr_t supervisor_t::do_check(const child_id_t &child_id, health_t &health) noexcept {
    auto it = entries.find(child_id);
    if (it == entries.end()) {
        return make_error(stringify(child_id), supervision_code_t::child_not_found);
    }
    auto &entry = it->second;
    auto &name = entry.descriptor.name;
    auto instance = entry.handle.instance;
    if (entry.handle.state != child_state_t::running || !instance) {
        health = entry.health;
        return {};
    }

    auto &health_config = *config.health;
    if (entry.calls->busy()) {
        health = health_t::failed("previous health check is still pending");
    } else {
        auto result = detail::timed_call(health_config.check_timeout, entry.calls,
                                         [instance]() { return instance->health_check(); });
        health = result ? *result : health_t::failed("health check timeout");
    }
    entry.health = health;

    switch (health.status) {
    case health_status_t::healthy:
        entry.health_failures = 0;
        return {};
    case health_status_t::degraded:
        LOG_WARN(log, "{}: {} is degraded: {}", config.identity, name, health.reason);
        emit(supervision_event_kind_t::failed, &child_id,
             {{"name", name}, {"health", "degraded"}, {"reason", health.reason}});
        return {};
    case health_status_t::failed:
        break;
    }

    ++entry.health_failures;
    LOG_WARN(log, "{}: {} health check failed ({}/{}): {}", config.identity, name, entry.health_failures,
             health_config.failure_threshold, health.reason);
    emit(supervision_event_kind_t::failed, &child_id,
         {{"name", name},
          {"health", "failed"},
          {"reason", health.reason},
          {"consecutive_failures", std::to_string(entry.health_failures)}});
    if (entry.health_failures < health_config.failure_threshold) {
        return {};
    }
    entry.health_failures = 0;
    auto reason = make_error(name + ": " + health.reason, supervision_code_t::health_check_failed);
    return do_terminated(child_id, reason, true);
}

extended_error_ptr_t supervisor_t::check_child_health(const child_id_t &child_id, health_t &health) noexcept {
    lock_t lock(mutex);
    if (!config.health) {
        return make_error(config.identity, supervision_code_t::health_monitoring_disabled);
    }
    return do_check(child_id, health);
}

extended_error_ptr_t supervisor_t::check_health() noexcept {
    lock_t lock(mutex);
    if (!config.health) {
        return make_error(config.identity, supervision_code_t::health_monitoring_disabled);
    }
    if (state != state_t::running) {
        return make_error(config.identity, supervision_code_t::supervisor_shutting_down);
    }
    auto ids = order;
    extended_error_ptr_t r;
    for (auto &child_id : ids) {
        if (entries.find(child_id) == entries.end()) {
            continue;
        }
        health_t health;
        auto ee = do_check(child_id, health);
        if (ee && !r) {
            r = ee;
        }
    }
    return r;
}

std::vector<child_status_t> supervisor_t::health_snapshot() const noexcept {
    lock_t lock(mutex);
    std::vector<child_status_t> r;
    r.reserve(order.size());
    for (auto &child_id : order) {
        auto &entry = entries.find(child_id)->second;
        auto &handle = entry.handle;
        r.push_back(child_status_t{child_id, entry.descriptor.name, handle.state, handle.restart_count, entry.health,
                                   handle.start_time, handle.last_restart});
    }
    return r;
}

std::size_t supervisor_t::child_count() const noexcept {
    lock_t lock(mutex);
    return entries.size();
}

std::vector<child_id_t> supervisor_t::child_ids() const noexcept {
    lock_t lock(mutex);
    return order;
}

auto supervisor_t::get_state() const noexcept -> state_t {
    lock_t lock(mutex);
    return state;
}
