//
// Copyright (c) 2019-2025 Ivan Baidakou (basiliscos) (the dot dmol at gmail dot com)
//
// Distributed under the MIT Software License
//

#include "stator/backoff.h"
#include <algorithm>
#include <cmath>

using namespace stator;

backoff_config_t backoff_config_t::fixed(std::uint32_t max_restarts, const pt::time_duration &window,
                                         const pt::time_duration &delay) noexcept {
    backoff_config_t r;
    r.max_restarts = max_restarts;
    r.window = window;
    r.kind = delay_kind_t::fixed;
    r.base = delay;
    r.cap = delay;
    return r;
}

backoff_config_t backoff_config_t::exponential(std::uint32_t max_restarts, const pt::time_duration &window,
                                               const pt::time_duration &base, double multiplier,
                                               const pt::time_duration &cap) noexcept {
    backoff_config_t r;
    r.max_restarts = max_restarts;
    r.window = window;
    r.kind = delay_kind_t::exponential;
    r.base = base;
    r.multiplier = multiplier;
    r.cap = cap;
    return r;
}

bool backoff_config_t::validate() const noexcept {
    if (window.is_negative() || base.is_negative() || cap.is_negative()) {
        return false;
    }
    return kind == delay_kind_t::fixed || multiplier >= 1.0;
}

backoff_t::backoff_t(const backoff_config_t &config_) noexcept : config{config_} {}

void backoff_t::prune(const pt::ptime &now) noexcept {
    while (!restarts.empty() && (now - restarts.front()) > config.window) {
        restarts.pop_front();
    }
}

pt::time_duration backoff_t::delay_for(std::uint32_t count) const noexcept {
    if (config.kind == delay_kind_t::fixed) {
        return config.base;
    }
    auto exponent = std::min(count, max_exponent);
    auto factor = std::pow(config.multiplier, static_cast<double>(exponent));
    auto micros = static_cast<double>(config.base.total_microseconds()) * factor;
    auto cap = static_cast<double>(config.cap.total_microseconds());
    return pt::microseconds{static_cast<std::int64_t>(std::min(micros, cap))};
}

pt::time_duration backoff_t::record_restart(const pt::ptime &now) noexcept {
    prune(now);
    auto delay = delay_for(static_cast<std::uint32_t>(restarts.size()));
    restarts.push_back(now);
    return delay;
}

pt::time_duration backoff_t::record_restart() noexcept { return record_restart(pt::microsec_clock::universal_time()); }

bool backoff_t::should_restart(const pt::ptime &now) noexcept {
    prune(now);
    return restarts.size() < config.max_restarts;
}

bool backoff_t::should_restart() noexcept { return should_restart(pt::microsec_clock::universal_time()); }

std::uint32_t backoff_t::restart_count(const pt::ptime &now) noexcept {
    prune(now);
    return static_cast<std::uint32_t>(restarts.size());
}

std::uint32_t backoff_t::restart_count() noexcept { return restart_count(pt::microsec_clock::universal_time()); }

void backoff_t::reset() noexcept { restarts.clear(); }
