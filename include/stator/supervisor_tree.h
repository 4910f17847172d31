#pragma once

//
// Copyright (c) 2019-2025 Ivan Baidakou (basiliscos) (the dot dmol at gmail dot com)
//
// Distributed under the MIT Software License
//

#include "supervisor.h"
#include <boost/functional/hash.hpp>
#include <mutex>
#include <optional>
#include <unordered_map>
#include <vector>

#if defined(_MSC_VER)
#pragma warning(push)
#pragma warning(disable : 4251)
#endif

namespace stator {

/** \struct supervisor_tree_t
 *  \brief hierarchy of supervisors
 *
 * The non-root supervisor is started as the child of its parent, so
 * the parent strategy is applied, when the nested supervisor fails
 * (i.e. escalates the failure of own child).
 *
 * The tree tracks parent-children relations between supervisors, so
 * that the whole subtree can be removed (children first) or shut down.
 *
 */
struct STATOR_API supervisor_tree_t {
    /** \brief alias for supervisors ids */
    using ids_t = std::vector<supervisor_id_t>;

    supervisor_tree_t(system_context_t &system_context) noexcept;

    supervisor_tree_t(const supervisor_tree_t &) = delete;
    supervisor_tree_t(supervisor_tree_t &&) = delete;

    ~supervisor_tree_t();

    /** \brief creates root (without `parent`) or nested supervisor
     *
     * The `id` is set upon success. The unknown parent is reported as
     * `tree_integrity_violation`.
     */
    extended_error_ptr_t create_supervisor(const std::optional<supervisor_id_t> &parent,
                                           const supervisor_config_t &config, supervisor_id_t &id) noexcept;

    /** \brief shuts the supervisor down and removes it and all its descendants */
    extended_error_ptr_t remove_supervisor(const supervisor_id_t &id) noexcept;

    /** \brief looks the supervisor up by id */
    extended_error_ptr_t get_supervisor(const supervisor_id_t &id, supervisor_ptr_t &supervisor) const noexcept;

    /** \brief returns parent id (empty for roots and unknown supervisors) */
    std::optional<supervisor_id_t> get_parent(const supervisor_id_t &id) const noexcept;

    /** \brief returns nested supervisors ids */
    ids_t get_children(const supervisor_id_t &id) const noexcept;

    /** \brief reports supervisor failure to its parent
     *
     * The parent applies its strategy to the failed supervisor. For the
     * root supervisor there is nobody to escalate to, and the
     * `tree_integrity_violation` error is returned.
     */
    extended_error_ptr_t escalate_error(const supervisor_id_t &id, const extended_error_ptr_t &ee) noexcept;

    /** \brief removes all supervisors */
    extended_error_ptr_t shutdown() noexcept;

    /** \brief total amount of supervisors */
    std::size_t supervisor_count() const noexcept;

    /** \brief amount of root supervisors */
    std::size_t root_count() const noexcept;

  private:
    struct node_t {
        supervisor_ptr_t supervisor;
        std::optional<supervisor_id_t> parent;
        child_id_t child_id;
        ids_t children;
    };

    using nodes_t = std::unordered_map<supervisor_id_t, node_t, boost::hash<supervisor_id_t>>;

    extended_error_ptr_t do_remove(const supervisor_id_t &id) noexcept;

    system_context_t &system_context;
    logger_t log;
    mutable std::mutex mutex;
    nodes_t nodes;
    ids_t roots;
};

} // namespace stator

#if defined(_MSC_VER)
#pragma warning(pop)
#endif
