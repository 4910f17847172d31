#pragma once

//
// Copyright (c) 2019-2025 Ivan Baidakou (basiliscos) (the dot dmol at gmail dot com)
//
// Distributed under the MIT Software License
//

#include "forward.hpp"
#include "stator/export.h"
#include <cstdint>
#include <deque>

#if defined(_MSC_VER)
#pragma warning(push)
#pragma warning(disable : 4251)
#endif

namespace stator {

/** \brief how the delay before the next restart is calculated */
enum class delay_kind_t {
    /** \brief the delay is always the same (base) */
    fixed,

    /** \brief `min(base * multiplier ^ count, cap)` */
    exponential,
};

/** \struct backoff_config_t
 *  \brief restart limits and restart delay curve
 */
struct STATOR_API backoff_config_t {
    /** \brief max amount of restarts in the window */
    std::uint32_t max_restarts = 5;

    /** \brief sliding window duration */
    pt::time_duration window = pt::seconds{60};

    /** \brief delay curve */
    delay_kind_t kind = delay_kind_t::exponential;

    /** \brief the fixed delay, or the initial exponential delay */
    pt::time_duration base = pt::millisec{100};

    /** \brief exponential delay multiplier */
    double multiplier = 2.0;

    /** \brief max exponential delay */
    pt::time_duration cap = pt::seconds{60};

    /** \brief config with fixed delay */
    static backoff_config_t fixed(std::uint32_t max_restarts, const pt::time_duration &window,
                                  const pt::time_duration &delay) noexcept;

    /** \brief config with exponential delay */
    static backoff_config_t exponential(std::uint32_t max_restarts, const pt::time_duration &window,
                                        const pt::time_duration &base, double multiplier,
                                        const pt::time_duration &cap) noexcept;

    /** \brief checks that durations are non-negative and multiplier is at least 1 */
    bool validate() const noexcept;
};

/** \struct backoff_t
 *  \brief sliding window restarts counter
 *
 * The restarts older than the window are forgotten, so the counter
 * decays by itself, if there are no recent restarts.
 *
 */
struct STATOR_API backoff_t {
    /** \brief max exponent, used to calculate exponential delay */
    static constexpr std::uint32_t max_exponent = 10;

    backoff_t(const backoff_config_t &config = {}) noexcept;

    /** \brief records restart and returns the delay to be applied before it */
    pt::time_duration record_restart(const pt::ptime &now) noexcept;

    /** \brief records restart at the current time */
    pt::time_duration record_restart() noexcept;

    /** \brief `false` if the amount of restarts in the window reached the max */
    bool should_restart(const pt::ptime &now) noexcept;

    /** \brief checks the restart limit at the current time */
    bool should_restart() noexcept;

    /** \brief amount of restarts in the window */
    std::uint32_t restart_count(const pt::ptime &now) noexcept;

    /** \brief amount of restarts in the window at the current time */
    std::uint32_t restart_count() noexcept;

    /** \brief the delay for the restart, when `count` restarts already happened */
    pt::time_duration delay_for(std::uint32_t count) const noexcept;

    /** \brief forgets all restarts */
    void reset() noexcept;

    /** \brief backoff settings */
    inline const backoff_config_t &get_config() const noexcept { return config; }

  private:
    void prune(const pt::ptime &now) noexcept;

    backoff_config_t config;
    std::deque<pt::ptime> restarts;
};

} // namespace stator

#if defined(_MSC_VER)
#pragma warning(pop)
#endif
