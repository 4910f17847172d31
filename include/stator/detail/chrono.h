#pragma once

//
// Copyright (c) 2019-2025 Ivan Baidakou (basiliscos) (the dot dmol at gmail dot com)
//
// Distributed under the MIT Software License
//

#include "stator/forward.hpp"
#include <chrono>

namespace stator::detail {

/** \brief an alias for monotonic clock */
using clock_t = std::chrono::steady_clock;

/** \brief converts posix duration into std::chrono one (microsecond precision) */
inline std::chrono::microseconds to_chrono(const pt::time_duration &value) noexcept {
    return std::chrono::microseconds{value.total_microseconds()};
}

/** \brief whether the duration means "wait forever" */
inline bool is_unbounded(const pt::time_duration &value) noexcept {
    return value.is_pos_infinity() || value.is_not_a_date_time();
}

} // namespace stator::detail
