//
// Copyright (c) 2019-2025 Ivan Baidakou (basiliscos) (the dot dmol at gmail dot com)
//
// Distributed under the MIT Software License
//

#include "stator/bus.h"
#include "stator/detail/chrono.h"
#include <boost/uuid/uuid_io.hpp>
#include <algorithm>
#include <future>

using namespace stator;

bus_t::bus_t(asio::io_context &io_context_, bus_monitor_ptr_t monitor_) noexcept
    : io_context{io_context_}, monitor{std::move(monitor_)}, log{get_logger("stator.bus")},
      subscribers{std::make_shared<const streams_t>()} {
    if (!monitor) {
        monitor = new null_monitor_t<bus_event_t>();
    }
}

bus_t::~bus_t() { cancel_requests(); }

stream_ptr_t bus_t::subscribe() noexcept {
    auto stream = stream_ptr_t(new stream_t());
    std::lock_guard<std::mutex> lock(subscribers_mutex);
    auto current = std::atomic_load(&subscribers);
    auto copy = std::make_shared<streams_t>(*current);
    copy->push_back(stream);
    std::atomic_store(&subscribers, streams_ptr_t(std::move(copy)));
    LOG_DEBUG(log, "new subscriber, total: {}", current->size() + 1);
    return stream;
}

void bus_t::unsubscribe(const stream_ptr_t &stream) noexcept {
    {
        std::lock_guard<std::mutex> lock(subscribers_mutex);
        auto current = std::atomic_load(&subscribers);
        auto copy = std::make_shared<streams_t>();
        copy->reserve(current->size());
        std::copy_if(current->begin(), current->end(), std::back_inserter(*copy),
                     [&](auto &it) { return it != stream; });
        std::atomic_store(&subscribers, streams_ptr_t(std::move(copy)));
    }
    stream->close();
}

void bus_t::prune() noexcept {
    std::lock_guard<std::mutex> lock(subscribers_mutex);
    auto current = std::atomic_load(&subscribers);
    auto copy = std::make_shared<streams_t>();
    copy->reserve(current->size());
    std::copy_if(current->begin(), current->end(), std::back_inserter(*copy),
                 [](auto &it) { return !it->is_closed(); });
    LOG_TRACE(log, "pruned {} closed subscriber(s)", current->size() - copy->size());
    std::atomic_store(&subscribers, streams_ptr_t(std::move(copy)));
}

extended_error_ptr_t bus_t::publish(envelope_ptr_t envelope) noexcept {
    if (envelope->reply && envelope->correlation_id) {
        auto &id = *envelope->correlation_id;
        pending_t request;
        if (!take_pending(id, request)) {
            LOG_DEBUG(log, "late reply {} has been discarded", boost::uuids::to_string(id));
            emit(bus_event_kind_t::late_reply, envelope->recipient, id);
            return {};
        }
        if (request.timer) {
            boost::system::error_code ec;
            request.timer->cancel(ec);
        }
        LOG_TRACE(log, "request {} has been replied", boost::uuids::to_string(id));
        request.handler(std::move(envelope));
        return {};
    }

    if (!envelope->recipient) {
        LOG_ERROR(log, "cannot publish envelope without recipient");
        return make_error("bus", error_code_t::route_misconfigured);
    }

    auto streams = std::atomic_load(&subscribers);
    bool has_closed = false;
    for (auto &stream : *streams) {
        auto ee = stream->send(envelope);
        if (ee) {
            has_closed = true;
        }
    }
    emit(bus_event_kind_t::published, envelope->recipient, envelope->correlation_id);
    if (has_closed) {
        prune();
    }
    return {};
}

void bus_t::add_pending(const correlation_id_t &id, pending_t &&request) noexcept {
    std::lock_guard<std::mutex> lock(pending_mutex);
    auto [it, inserted] = pending.emplace(id, std::move(request));
    auto &timer = it->second.timer;
    if (inserted && timer) {
        auto self = intrusive_ptr_t<bus_t>(this);
        timer->expires_at(it->second.deadline);
        timer->async_wait([self = std::move(self), id = id](const boost::system::error_code &ec) {
            if (!ec) {
                self->on_timeout(id);
            }
        });
    }
}

bool bus_t::take_pending(const correlation_id_t &id, pending_t &request) noexcept {
    std::lock_guard<std::mutex> lock(pending_mutex);
    auto it = pending.find(id);
    if (it == pending.end()) {
        return false;
    }
    request = std::move(it->second);
    pending.erase(it);
    return true;
}

void bus_t::on_timeout(const correlation_id_t &id) noexcept {
    pending_t request;
    if (take_pending(id, request)) {
        LOG_DEBUG(log, "request {} timed out", boost::uuids::to_string(id));
        emit(bus_event_kind_t::request_timeout, {}, id);
        request.handler({});
    }
}

extended_error_ptr_t bus_t::async_request(envelope_ptr_t envelope, const pt::time_duration &timeout,
                                          reply_handler_t handler) noexcept {
    auto id = make_uuid();
    envelope->correlation_id = id;
    envelope->reply = false;

    auto now = pt::microsec_clock::universal_time();
    pending_t request{std::move(handler), now, pt::ptime(pt::pos_infin), {}};
    if (!detail::is_unbounded(timeout)) {
        request.deadline = now + timeout;
        request.timer = std::make_unique<timer_t>(io_context);
    }
    add_pending(id, std::move(request));

    auto ee = publish(std::move(envelope));
    if (ee) {
        pending_t discarded;
        if (take_pending(id, discarded) && discarded.timer) {
            boost::system::error_code ec;
            discarded.timer->cancel(ec);
        }
        return ee;
    }
    return {};
}

extended_error_ptr_t bus_t::publish_request(envelope_ptr_t envelope, const pt::time_duration &timeout,
                                            envelope_ptr_t &reply) noexcept {
    reply.reset();
    auto id = make_uuid();
    envelope->correlation_id = id;
    envelope->reply = false;

    auto promise = std::make_shared<std::promise<envelope_ptr_t>>();
    auto future = promise->get_future();
    auto now = pt::microsec_clock::universal_time();
    auto deadline = detail::is_unbounded(timeout) ? pt::ptime(pt::pos_infin) : now + timeout;
    auto handler = [promise](envelope_ptr_t result) { promise->set_value(std::move(result)); };
    add_pending(id, pending_t{std::move(handler), now, deadline, {}});

    auto ee = publish(std::move(envelope));
    if (ee) {
        pending_t discarded;
        take_pending(id, discarded);
        return ee;
    }

    bool ready = true;
    if (detail::is_unbounded(timeout)) {
        future.wait();
    } else {
        ready = future.wait_for(detail::to_chrono(timeout)) == std::future_status::ready;
    }

    if (!ready) {
        pending_t expired;
        if (take_pending(id, expired)) {
            LOG_DEBUG(log, "request {} timed out", boost::uuids::to_string(id));
            emit(bus_event_kind_t::request_timeout, {}, id);
            return {};
        }
        /* the reply is being handled concurrently, it is a matter of moments */
    }
    reply = future.get();
    return {};
}

void bus_t::cancel_requests() noexcept {
    pending_map_t requests;
    {
        std::lock_guard<std::mutex> lock(pending_mutex);
        requests = std::move(pending);
        pending.clear();
    }
    for (auto &[id, request] : requests) {
        if (request.timer) {
            boost::system::error_code ec;
            request.timer->cancel(ec);
        }
        LOG_DEBUG(log, "request {} has been cancelled", boost::uuids::to_string(id));
        request.handler({});
    }
}

std::size_t bus_t::pending_requests() const noexcept {
    std::lock_guard<std::mutex> lock(pending_mutex);
    return pending.size();
}

std::size_t bus_t::subscribers_count() const noexcept { return std::atomic_load(&subscribers)->size(); }

void bus_t::emit(bus_event_kind_t kind, const std::optional<address_t> &address,
                 const std::optional<correlation_id_t> &correlation_id, const extended_error_ptr_t &error) noexcept {
    monitor->record(bus_event_t{utc_now(), kind, address, correlation_id, error});
}
