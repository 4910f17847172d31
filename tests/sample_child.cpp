//
// Copyright (c) 2019-2025 Ivan Baidakou (basiliscos) (the dot dmol at gmail dot com)
//
// Distributed under the MIT Software License
//

#include "sample_child.h"
#include "stator/detail/chrono.h"
#include <stdexcept>
#include <thread>

using namespace stator;
using namespace stator::test;

namespace {

void pause(const pt::time_duration &value) {
    if (!value.is_special() && value > pt::time_duration{}) {
        std::this_thread::sleep_for(detail::to_chrono(value));
    }
}

} // namespace

void journal_t::add(std::string record) noexcept {
    std::lock_guard<std::mutex> lock(mutex);
    records.emplace_back(std::move(record));
}

std::vector<std::string> journal_t::take() noexcept {
    std::lock_guard<std::mutex> lock(mutex);
    auto r = std::move(records);
    records.clear();
    return r;
}

script_t::script_t(std::string name_, journal_ptr_t journal_) noexcept
    : name{std::move(name_)}, journal{std::move(journal_)} {}

factory_t script_t::factory() noexcept {
    auto self = shared_from_this();
    return [self]() -> child_ptr_t {
        if (self->throw_on_create) {
            throw std::runtime_error("cannot create " + self->name);
        }
        if (self->return_null) {
            return {};
        }
        auto child = sample_child_ptr_t(new sample_child_t(self));
        ++self->created;
        std::lock_guard<std::mutex> lock(self->mutex);
        self->instance = child;
        return child;
    };
}

sample_child_ptr_t script_t::current() noexcept {
    std::lock_guard<std::mutex> lock(mutex);
    return instance;
}

void script_t::set_health(health_t value) noexcept {
    std::lock_guard<std::mutex> lock(mutex);
    health = std::move(value);
}

health_t script_t::get_health() noexcept {
    std::lock_guard<std::mutex> lock(mutex);
    return health;
}

sample_child_t::sample_child_t(const script_ptr_t &script_) noexcept : script{script_} {}

extended_error_ptr_t sample_child_t::start() noexcept {
    auto p = script.lock();
    if (!p) {
        return {};
    }
    pause(p->start_delay);
    if (p->fail_starts > 0) {
        --p->fail_starts;
        return make_test_error(p->name + " refuses to start");
    }
    ++p->started;
    if (p->journal) {
        p->journal->add("start:" + p->name);
    }
    return {};
}

extended_error_ptr_t sample_child_t::stop(const pt::time_duration &) noexcept {
    auto p = script.lock();
    if (!p) {
        return {};
    }
    pause(p->stop_delay);
    ++p->stopped;
    if (p->journal) {
        p->journal->add("stop:" + p->name);
    }
    if (p->fail_stop) {
        return make_test_error(p->name + " refuses to stop");
    }
    return {};
}

void sample_child_t::terminate() noexcept {
    auto p = script.lock();
    if (!p) {
        return;
    }
    ++p->terminated;
    if (p->journal) {
        p->journal->add("terminate:" + p->name);
    }
}

health_t sample_child_t::health_check() noexcept {
    auto p = script.lock();
    if (!p) {
        return health_t::healthy();
    }
    ++p->health_checks;
    pause(p->health_delay);
    return p->get_health();
}

void sample_child_t::crash(const std::string &what) noexcept { report_failure(make_test_error(what)); }

bool stator::test::wait_until(const std::function<bool()> &predicate, const pt::time_duration &timeout) {
    auto deadline = utc_now() + timeout;
    while (!predicate()) {
        if (utc_now() > deadline) {
            return false;
        }
        std::this_thread::sleep_for(std::chrono::milliseconds(1));
    }
    return true;
}

system_context_ptr_t stator::test::make_context(std::size_t workers) {
    auto ctx = system_context_t::configure()
                   .worker_threads(workers)
                   .registry_shards(4)
                   .mailbox(64, backpressure_t::adaptive)
                   .send_timeout(pt::millisec{50})
                   .timeout(pt::seconds{1})
                   .finish();
    auto ee = ctx->start();
    if (ee) {
        throw std::runtime_error(ee->message());
    }
    return ctx;
}
