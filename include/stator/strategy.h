#pragma once

//
// Copyright (c) 2019-2025 Ivan Baidakou (basiliscos) (the dot dmol at gmail dot com)
//
// Distributed under the MIT Software License
//

#include "forward.hpp"
#include <algorithm>
#include <vector>

namespace stator {

/** \brief which siblings are restarted when one child fails */
enum class strategy_t {
    /** \brief only the failed child is restarted */
    isolate_one,

    /** \brief all children are restarted, in the start order */
    restart_all,

    /** \brief the failed child and all children started after it are restarted */
    restart_tail,
};

/** \brief human-readable strategy name */
inline const char *to_string(strategy_t strategy) noexcept {
    switch (strategy) {
    case strategy_t::isolate_one:
        return "isolate_one";
    case strategy_t::restart_all:
        return "restart_all";
    case strategy_t::restart_tail:
        return "restart_tail";
    }
    return "unknown";
}

/** \brief returns children to be restarted, in the start order
 *
 * The `ordered` is the list of children ids in the start order. If
 * the `failed` is not in the list, the empty list is returned.
 *
 */
inline std::vector<child_id_t> restart_set(strategy_t strategy, const child_id_t &failed,
                                           const std::vector<child_id_t> &ordered) {
    auto it = std::find(ordered.begin(), ordered.end(), failed);
    if (it == ordered.end()) {
        return {};
    }
    switch (strategy) {
    case strategy_t::isolate_one:
        return {failed};
    case strategy_t::restart_all:
        return ordered;
    case strategy_t::restart_tail:
        return std::vector<child_id_t>(it, ordered.end());
    }
    return {};
}

} // namespace stator
