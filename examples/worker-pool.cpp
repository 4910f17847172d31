//
// Copyright (c) 2019-2025 Ivan Baidakou (basiliscos) (the dot dmol at gmail dot com)
//
// Distributed under the MIT Software License
//

/*
 *
 * Three workers are registered as members of the "hashers" pool. The
 * jobs are sent to the pool address, and the router picks the worker
 * in round robin manner.
 *
 */

#include "stator.hpp"
#include <functional>
#include <iostream>
#include <thread>

namespace s = stator;
namespace pt = boost::posix_time;

namespace payload {
struct job_t {
    std::string data;
};
} // namespace payload

struct worker_t : s::actor_base_t {
    using s::actor_base_t::actor_base_t;

    s::extended_error_ptr_t on_message(s::envelope_t &envelope) noexcept override {
        if (auto job = envelope.payload_cast<payload::job_t>(); job) {
            auto hash = std::hash<std::string>()(job->data);
            LOG_INFO(log, "{} hashed '{}' into {:x}", address.to_string(), job->data, hash);
            ++done;
        }
        return {};
    }

    std::atomic_int done{0};
};

using worker_ptr_t = s::intrusive_ptr_t<worker_t>;

int main() {
    auto ctx = s::system_context_t::configure()
                   .worker_threads(3)
                   .pool_strategy(s::pool_strategy_t::round_robin)
                   .finish();
    if (!ctx || ctx->start()) {
        return 1;
    }

    std::vector<worker_ptr_t> workers;
    for (int i = 0; i < 3; ++i) {
        auto worker = ctx->make_actor<worker_t>(s::address_t::pool_member("hashers", "w" + std::to_string(i)));
        if (auto ee = worker->start(); ee) {
            std::cout << "cannot start worker: " << ee->message() << "\n";
            return 1;
        }
        workers.push_back(worker);
    }

    auto pool = s::address_t::pool("hashers");
    int jobs = 12;
    for (int i = 0; i < jobs; ++i) {
        auto ee = ctx->get_bus().publish(s::make_envelope<payload::job_t>(pool, "job-" + std::to_string(i)));
        if (ee) {
            std::cout << "cannot publish job: " << ee->message() << "\n";
        }
    }

    auto total = [&]() {
        int r = 0;
        for (auto &worker : workers) {
            r += worker->done;
        }
        return r;
    };
    while (total() < jobs) {
        std::this_thread::sleep_for(std::chrono::milliseconds(1));
    }

    for (auto &worker : workers) {
        std::cout << worker->get_address() << " processed " << worker->done << " jobs\n";
        if (auto ee = worker->stop(pt::seconds{1}); ee) {
            std::cout << "cannot stop worker: " << ee->message() << "\n";
        }
    }
    ctx->shutdown();
    return 0;
}
