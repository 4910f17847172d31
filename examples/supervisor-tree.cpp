//
// Copyright (c) 2019-2025 Ivan Baidakou (basiliscos) (the dot dmol at gmail dot com)
//
// Distributed under the MIT Software License
//

/*
 *
 * Builds a small supervision tree: "app" with the "storage" and "network"
 * subtrees, each supervising a few plain children. The children report
 * their health, the tree structure and the children snapshots are printed,
 * and the whole tree is shut down (children are stopped in reverse start
 * order).
 *
 */

#include "stator.hpp"
#include <iostream>

namespace s = stator;
namespace pt = boost::posix_time;

struct service_t : s::child_t {
    service_t(std::string name_, bool degraded_) : name{std::move(name_)}, degraded{degraded_} {}

    s::extended_error_ptr_t start() noexcept override {
        std::cout << "  starting " << name << "\n";
        return {};
    }

    s::extended_error_ptr_t stop(const pt::time_duration &) noexcept override {
        std::cout << "  stopping " << name << "\n";
        return {};
    }

    s::health_t health_check() noexcept override {
        return degraded ? s::health_t::degraded("slow disk") : s::health_t::healthy();
    }

    std::string name;
    bool degraded;
};

static void print(s::supervisor_tree_t &tree, const s::supervisor_id_t &id, int depth) {
    s::supervisor_ptr_t sup;
    if (tree.get_supervisor(id, sup)) {
        return;
    }
    auto indent = std::string(depth * 2, ' ');
    std::cout << indent << sup->get_identity() << " (" << s::to_string(sup->get_config().strategy) << ")\n";
    for (auto &status : sup->health_snapshot()) {
        std::cout << indent << "  - " << status.name << ": " << s::to_string(status.health.status) << "\n";
    }
    for (auto &child : tree.get_children(id)) {
        print(tree, child, depth + 1);
    }
}

int main() {
    auto ctx = s::system_context_t::configure().worker_threads(2).finish();
    if (!ctx || ctx->start()) {
        return 1;
    }
    s::supervisor_tree_t tree(*ctx);

    auto make_config = [](std::string identity, s::strategy_t strategy) {
        s::supervisor_config_t config;
        config.identity = std::move(identity);
        config.strategy = strategy;
        config.health = s::health_config_t{pt::seconds{60}, pt::seconds{1}, 3};
        return config;
    };

    std::cout << "building the tree\n";
    s::supervisor_id_t app{}, storage{}, network{};
    auto ee = tree.create_supervisor({}, make_config("app", s::strategy_t::isolate_one), app);
    if (!ee) {
        ee = tree.create_supervisor(app, make_config("storage", s::strategy_t::restart_tail), storage);
    }
    if (!ee) {
        ee = tree.create_supervisor(app, make_config("network", s::strategy_t::restart_all), network);
    }
    if (ee) {
        std::cout << "cannot build the tree: " << ee->message() << "\n";
        return 1;
    }

    auto add = [&](const s::supervisor_id_t &parent, const std::string &name, bool degraded) {
        s::supervisor_ptr_t sup;
        if (auto ee = tree.get_supervisor(parent, sup); ee) {
            return ee;
        }
        auto factory = [name, degraded]() -> s::child_ptr_t { return new service_t(name, degraded); };
        s::child_id_t id{};
        if (auto ee = sup->start_child(s::describe_child(name, factory).finish(), id); ee) {
            return ee;
        }
        s::health_t health;
        return sup->check_child_health(id, health);
    };
    for (auto &name : {"journal", "index", "compactor"}) {
        if (auto ee = add(storage, name, std::string(name) == "compactor"); ee) {
            std::cout << "cannot add " << name << ": " << ee->message() << "\n";
        }
    }
    for (auto &name : {"listener", "dialer"}) {
        if (auto ee = add(network, name, false); ee) {
            std::cout << "cannot add " << name << ": " << ee->message() << "\n";
        }
    }

    std::cout << "the tree of " << tree.supervisor_count() << " supervisors:\n";
    print(tree, app, 0);

    std::cout << "shutting down\n";
    if (auto ee = tree.shutdown(); ee) {
        std::cout << "shutdown failure: " << ee->message() << "\n";
    }
    ctx->shutdown();
    return 0;
}
