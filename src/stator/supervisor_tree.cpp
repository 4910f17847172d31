//
// Copyright (c) 2019-2025 Ivan Baidakou (basiliscos) (the dot dmol at gmail dot com)
//
// Distributed under the MIT Software License
//

#include "stator/supervisor_tree.h"
#include "stator/system_context.h"
#include "stator/error_code.h"
#include <boost/uuid/uuid_io.hpp>
#include <algorithm>

using namespace stator;

supervisor_tree_t::supervisor_tree_t(system_context_t &system_context_) noexcept
    : system_context{system_context_}, log{get_logger("stator.tree")} {}

supervisor_tree_t::~supervisor_tree_t() {
    auto ee = shutdown();
    if (ee) {
        LOG_WARN(log, "supervisors tree has been destroyed with error: {}", ee->message());
    }
}

extended_error_ptr_t supervisor_tree_t::create_supervisor(const std::optional<supervisor_id_t> &parent,
                                                          const supervisor_config_t &config,
                                                          supervisor_id_t &id) noexcept {
    std::lock_guard<std::mutex> lock(mutex);
    node_t *parent_node = nullptr;
    if (parent) {
        auto it = nodes.find(*parent);
        if (it == nodes.end()) {
            LOG_ERROR(log, "cannot create {}: parent {} is unknown", config.identity, boost::uuids::to_string(*parent));
            return make_error(boost::uuids::to_string(*parent), supervision_code_t::tree_integrity_violation);
        }
        parent_node = &it->second;
    }

    auto builder = supervisor_config_builder_t(system_context);
    builder.config = config;
    auto supervisor = std::move(builder).finish();
    if (!supervisor) {
        return make_error(config.identity, supervision_code_t::child_start_failed);
    }

    child_id_t child_id{};
    if (parent_node) {
        auto descriptor = describe_child(config.identity, [supervisor]() -> child_ptr_t { return supervisor; })
                              .restart_policy(restart_policy_t::permanent)
                              .shutdown_policy(shutdown_policy_t::infinity())
                              .finish();
        auto ee = parent_node->supervisor->start_child(descriptor, child_id);
        if (ee) {
            auto shutdown_ee = supervisor->shutdown();
            if (shutdown_ee) {
                LOG_WARN(log, "{}: {}", config.identity, shutdown_ee->message());
            }
            return ee;
        }
    }

    auto new_id = supervisor->get_id();
    nodes.emplace(new_id, node_t{supervisor, parent, child_id, {}});
    if (parent_node) {
        parent_node->children.push_back(new_id);
        LOG_DEBUG(log, "{} has been created under {}", config.identity, parent_node->supervisor->get_identity());
    } else {
        roots.push_back(new_id);
        LOG_DEBUG(log, "{} has been created as root", config.identity);
    }
    id = new_id;
    return {};
}

extended_error_ptr_t supervisor_tree_t::do_remove(const supervisor_id_t &id) noexcept {
    auto it = nodes.find(id);
    if (it == nodes.end()) {
        return make_error(boost::uuids::to_string(id), supervision_code_t::supervisor_not_found);
    }

    extended_error_ptr_t r;
    auto children = it->second.children;
    for (auto child = children.rbegin(); child != children.rend(); ++child) {
        auto ee = do_remove(*child);
        if (ee && !r) {
            r = ee;
        }
    }

    it = nodes.find(id);
    auto node = std::move(it->second);
    nodes.erase(it);

    if (node.parent) {
        auto parent = nodes.find(*node.parent);
        if (parent == nodes.end()) {
            return make_error(boost::uuids::to_string(*node.parent), supervision_code_t::tree_integrity_violation);
        }
        auto &siblings = parent->second.children;
        siblings.erase(std::remove(siblings.begin(), siblings.end(), id), siblings.end());
        auto ee = parent->second.supervisor->stop_child(node.child_id);
        if (ee && !r) {
            r = ee;
        }
    } else {
        roots.erase(std::remove(roots.begin(), roots.end(), id), roots.end());
    }

    auto ee = node.supervisor->shutdown();
    if (ee && !r) {
        r = ee;
    }
    LOG_DEBUG(log, "{} has been removed", node.supervisor->get_identity());
    return r;
}

extended_error_ptr_t supervisor_tree_t::remove_supervisor(const supervisor_id_t &id) noexcept {
    std::lock_guard<std::mutex> lock(mutex);
    return do_remove(id);
}

extended_error_ptr_t supervisor_tree_t::get_supervisor(const supervisor_id_t &id,
                                                       supervisor_ptr_t &supervisor) const noexcept {
    std::lock_guard<std::mutex> lock(mutex);
    auto it = nodes.find(id);
    if (it == nodes.end()) {
        return make_error(boost::uuids::to_string(id), supervision_code_t::supervisor_not_found);
    }
    supervisor = it->second.supervisor;
    return {};
}

std::optional<supervisor_id_t> supervisor_tree_t::get_parent(const supervisor_id_t &id) const noexcept {
    std::lock_guard<std::mutex> lock(mutex);
    auto it = nodes.find(id);
    if (it == nodes.end()) {
        return {};
    }
    return it->second.parent;
}

auto supervisor_tree_t::get_children(const supervisor_id_t &id) const noexcept -> ids_t {
    std::lock_guard<std::mutex> lock(mutex);
    auto it = nodes.find(id);
    if (it == nodes.end()) {
        return {};
    }
    return it->second.children;
}

extended_error_ptr_t supervisor_tree_t::escalate_error(const supervisor_id_t &id,
                                                       const extended_error_ptr_t &ee) noexcept {
    supervisor_ptr_t parent;
    child_id_t child_id;
    std::string identity;
    {
        std::lock_guard<std::mutex> lock(mutex);
        auto it = nodes.find(id);
        if (it == nodes.end()) {
            return make_error(boost::uuids::to_string(id), supervision_code_t::supervisor_not_found);
        }
        auto &node = it->second;
        identity = node.supervisor->get_identity();
        if (!node.parent) {
            LOG_CRITICAL(log, "root supervisor {} has unrecoverable error: {}", identity, ee ? ee->message() : "");
            return make_error(identity, supervision_code_t::tree_integrity_violation, ee);
        }
        auto parent_it = nodes.find(*node.parent);
        if (parent_it == nodes.end()) {
            return make_error(identity, supervision_code_t::tree_integrity_violation, ee);
        }
        parent = parent_it->second.supervisor;
        child_id = node.child_id;
    }
    LOG_WARN(log, "{} escalates failure to {}", identity, parent->get_identity());
    auto reason = make_error(identity, supervision_code_t::escalated_failure, ee);
    return parent->handle_child_failure(child_id, reason);
}

extended_error_ptr_t supervisor_tree_t::shutdown() noexcept {
    std::lock_guard<std::mutex> lock(mutex);
    extended_error_ptr_t r;
    auto ids = roots;
    for (auto it = ids.rbegin(); it != ids.rend(); ++it) {
        auto ee = do_remove(*it);
        if (ee && !r) {
            r = ee;
        }
    }
    return r;
}

std::size_t supervisor_tree_t::supervisor_count() const noexcept {
    std::lock_guard<std::mutex> lock(mutex);
    return nodes.size();
}

std::size_t supervisor_tree_t::root_count() const noexcept {
    std::lock_guard<std::mutex> lock(mutex);
    return roots.size();
}
