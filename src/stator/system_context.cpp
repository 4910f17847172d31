//
// Copyright (c) 2019-2025 Ivan Baidakou (basiliscos) (the dot dmol at gmail dot com)
//
// Distributed under the MIT Software License
//

#include "stator/system_context.h"
#include "stator/supervisor.h"
#include <algorithm>

using namespace stator;

bool system_config_builder_t::validate() const noexcept {
    if (!config.worker_threads || !config.registry_shards) {
        return false;
    }
    if (config.start_timeout.is_negative() || config.shutdown_timeout.is_negative()) {
        return false;
    }
    return !config.router.send_timeout.is_negative();
}

system_context_ptr_t system_config_builder_t::finish() && {
    if (!validate()) {
        return {};
    }
    return system_context_ptr_t(new system_context_t(config));
}

system_context_t::system_context_t(const system_config_t &config_) noexcept
    : config{config_}, log{get_logger("stator.system")} {
    registry = new registry_t(config.registry_shards);
    bus = new bus_t(io_context, config.bus_monitor);
    router = new router_t(io_context, registry, bus, config.router);
}

system_context_t::~system_context_t() { shutdown(); }

extended_error_ptr_t system_context_t::start() noexcept {
    std::lock_guard<std::mutex> lock(lifecycle_mutex);
    if (shutdown_flag.load()) {
        return make_error("system_context", supervision_code_t::supervisor_shutting_down);
    }
    if (started.exchange(true)) {
        return {};
    }
    guard = std::make_unique<guard_t>(asio::make_work_guard(io_context));
    auto threads = std::max<std::size_t>(config.worker_threads, 1);
    for (std::size_t i = 0; i < threads; ++i) {
        workers.emplace_back([this]() { run_worker(); });
    }
    router->start();
    LOG_INFO(log, "system context has been started with {} worker(s)", threads);
    return {};
}

void system_context_t::run_worker() noexcept {
    while (true) {
        try {
            io_context.run();
            return;
        } catch (const std::exception &ex) {
            on_error(make_error(ex.what(), error_code_t::registry_internal));
        }
    }
}

void system_context_t::shutdown() noexcept {
    std::lock_guard<std::mutex> lock(lifecycle_mutex);
    if (shutdown_flag.exchange(true)) {
        return;
    }
    router->stop();
    bus->cancel_requests();
    guard.reset();
    io_context.stop();

    auto self_id = std::this_thread::get_id();
    for (auto &worker : workers) {
        if (worker.get_id() == self_id) {
            worker.detach();
        } else if (worker.joinable()) {
            worker.join();
        }
    }
    workers.clear();
    if (started.load()) {
        LOG_INFO(log, "system context has been shut down, dead letters: {}", router->get_dead_letters().get_total());
    }
}

supervisor_config_builder_t system_context_t::create_supervisor() noexcept {
    return supervisor_config_builder_t(*this);
}

mailbox_ptr_t system_context_t::make_mailbox() const noexcept {
    return mailbox_ptr_t(new mailbox_t(config.mailbox_capacity, config.backpressure));
}

void system_context_t::on_error(const extended_error_ptr_t &ec) noexcept {
    LOG_CRITICAL(log, "fatal error: {}", ec->message());
}
