#pragma once

//
// Copyright (c) 2019-2025 Ivan Baidakou (basiliscos) (the dot dmol at gmail dot com)
//
// Distributed under the MIT Software License
//

#include "arc.hpp"
#include "events.h"
#include "log.h"
#include <array>
#include <atomic>
#include <deque>
#include <mutex>
#include <vector>

namespace stator {

/** \struct monitor_t
 *  \brief abstract events sink
 *
 * The `record` is fire-and-forget operation: it must not block
 * the caller for long and it must not fail.
 *
 */
template <typename Event> struct monitor_t : arc_base_t<monitor_t<Event>> {
    virtual ~monitor_t() = default;

    /** \brief records the event */
    virtual void record(const Event &event) noexcept = 0;
};

/** \brief intrusive pointer to events sink */
template <typename Event> using monitor_ptr_t = intrusive_ptr_t<monitor_t<Event>>;

/** \brief supervision events sink (type) */
using supervision_monitor_t = monitor_t<supervision_event_t>;

/** \brief intrusive pointer to supervision events sink */
using supervision_monitor_ptr_t = monitor_ptr_t<supervision_event_t>;

/** \brief bus events sink (type) */
using bus_monitor_t = monitor_t<bus_event_t>;

/** \brief intrusive pointer to bus events sink */
using bus_monitor_ptr_t = monitor_ptr_t<bus_event_t>;

/** \struct null_monitor_t
 *  \brief the default sink, which ignores everything
 */
template <typename Event> struct null_monitor_t : monitor_t<Event> {
    void record(const Event &) noexcept override {}
};

/** \struct monitoring_config_t
 *  \brief in-memory monitor configuration
 */
struct monitoring_config_t {
    /** \brief whether events are recorded at all */
    bool enabled = true;

    /** \brief max amount of the recent events kept */
    std::size_t max_history_size = 1000;

    /** \brief events with lower severity are ignored */
    severity_t severity_filter = severity_t::info;
};

/** \struct monitoring_snapshot_t
 *  \brief the point-in-time view on the in-memory monitor state
 */
template <typename Event> struct monitoring_snapshot_t {
    /** \brief when the snapshot has been taken */
    pt::ptime timestamp;

    /** \brief total amount of accepted events */
    std::uint64_t total_events = 0;

    /** \brief amount of accepted events per severity */
    std::array<std::uint64_t, 6> severity_counts{};

    /** \brief recent events, oldest first */
    std::vector<Event> recent_events;

    /** \brief returns amount of accepted events with the given severity */
    inline std::uint64_t count(severity_t severity) const noexcept {
        return severity_counts[static_cast<std::size_t>(severity)];
    }
};

/** \struct in_memory_monitor_t
 *  \brief keeps bounded history of recent events and counters
 */
template <typename Event> struct in_memory_monitor_t : monitor_t<Event> {
    /** \brief alias for the snapshot type */
    using snapshot_t = monitoring_snapshot_t<Event>;

    in_memory_monitor_t(const monitoring_config_t &config_ = {}) noexcept : config{config_} {}

    void record(const Event &event) noexcept override {
        if (!config.enabled) {
            return;
        }
        auto severity = event.severity();
        if (severity < config.severity_filter) {
            return;
        }
        total_events.fetch_add(1, std::memory_order_relaxed);
        counters[static_cast<std::size_t>(severity)].fetch_add(1, std::memory_order_relaxed);

        std::lock_guard<std::mutex> lock(mutex);
        if (config.max_history_size && history.size() >= config.max_history_size) {
            history.pop_front();
        }
        history.push_back(event);
    }

    /** \brief takes a snapshot of the current state */
    snapshot_t snapshot() const noexcept {
        snapshot_t r;
        r.timestamp = utc_now();
        r.total_events = total_events.load(std::memory_order_relaxed);
        for (std::size_t i = 0; i < counters.size(); ++i) {
            r.severity_counts[i] = counters[i].load(std::memory_order_relaxed);
        }
        std::lock_guard<std::mutex> lock(mutex);
        r.recent_events.assign(history.begin(), history.end());
        return r;
    }

    /** \brief drops the history and counters */
    void reset() noexcept {
        total_events.store(0, std::memory_order_relaxed);
        for (auto &c : counters) {
            c.store(0, std::memory_order_relaxed);
        }
        std::lock_guard<std::mutex> lock(mutex);
        history.clear();
    }

  private:
    monitoring_config_t config;
    std::atomic<std::uint64_t> total_events{0};
    std::array<std::atomic<std::uint64_t>, 6> counters{};
    mutable std::mutex mutex;
    std::deque<Event> history;
};

/** \struct logging_monitor_t
 *  \brief writes events into the logger using the event severity
 */
template <typename Event> struct logging_monitor_t : monitor_t<Event> {
    logging_monitor_t(logger_t log_) noexcept : log{std::move(log_)} {}

    void record(const Event &event) noexcept override {
        auto level = spdlog::level::info;
        switch (event.severity()) {
        case severity_t::trace:
            level = spdlog::level::trace;
            break;
        case severity_t::debug:
            level = spdlog::level::debug;
            break;
        case severity_t::info:
            level = spdlog::level::info;
            break;
        case severity_t::warning:
            level = spdlog::level::warn;
            break;
        case severity_t::error:
            level = spdlog::level::err;
            break;
        case severity_t::critical:
            level = spdlog::level::critical;
            break;
        }
        if (log->should_log(level)) {
            log->log(level, "{}", event.to_string());
        }
    }

  private:
    logger_t log;
};

} // namespace stator
