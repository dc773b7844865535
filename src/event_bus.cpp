#include "event_bus.hpp"
#include <algorithm>

namespace session_tail {

const char* to_string(error_kind kind) {
    switch (kind) {
        case error_kind::io:           return "io";
        case error_kind::parse:        return "parse";
        case error_kind::subscriber:   return "subscriber";
        case error_kind::engine_fatal: return "engine_fatal";
    }
    return "unknown";
}

subscription::subscription(std::weak_ptr<event_bus> bus, uint64_t id)
    : m_bus(std::move(bus)), m_id(id)
{}

void subscription::unsubscribe() {
    if (auto bus = m_bus.lock()) {
        bus->unsubscribe(m_id);
    }
    m_bus.reset();
}

bool subscription::active() const {
    auto bus = m_bus.lock();
    return bus && bus->is_subscribed(m_id);
}

event_bus::event_bus(std::shared_ptr<spdlog::logger> log)
    : m_log(std::move(log))
{
    publish_snapshot();
}

void event_bus::publish_snapshot() {
    auto snap = std::make_shared<subscriber_list>(m_subscribers);
    std::atomic_store(&m_snapshot,
                      std::shared_ptr<const subscriber_list>(std::move(snap)));
}

subscription event_bus::subscribe(record_handler handler) {
    std::lock_guard<std::mutex> lock(m_write_mutex);

    auto sub = std::make_shared<subscriber>();
    sub->id = m_next_id++;
    sub->handler = std::move(handler);
    m_subscribers.push_back(sub);
    publish_snapshot();

    m_log->debug("event_bus: subscriber {} added ({} total)", sub->id, m_subscribers.size());
    return subscription(weak_from_this(), sub->id);
}

bool event_bus::unsubscribe(uint64_t id) {
    std::lock_guard<std::mutex> lock(m_write_mutex);

    auto it = std::find_if(m_subscribers.begin(), m_subscribers.end(),
                           [id](const auto& s) { return s->id == id; });
    if (it == m_subscribers.end()) return false;

    // An in-flight publish() may still hold the old snapshot; the flag stops
    // it from calling this handler again.
    (*it)->active.store(false);
    m_subscribers.erase(it);
    publish_snapshot();

    m_log->debug("event_bus: subscriber {} removed ({} remain)", id, m_subscribers.size());
    return true;
}

bool event_bus::is_subscribed(uint64_t id) const {
    auto snap = std::atomic_load(&m_snapshot);
    return std::any_of(snap->begin(), snap->end(),
                       [id](const auto& s) { return s->id == id; });
}

void event_bus::on_error(error_handler handler) {
    std::lock_guard<std::mutex> lock(m_error_mutex);
    m_error_handlers.push_back(std::move(handler));
}

void event_bus::publish(const record& r) {
    std::lock_guard<std::mutex> lock(m_delivery_mutex);

    auto snap = std::atomic_load(&m_snapshot);
    m_published.fetch_add(1, std::memory_order_relaxed);

    for (const auto& sub : *snap) {
        if (!sub->active.load()) continue;
        try {
            sub->handler(r);
        } catch (const std::exception& e) {
            m_log->warn("event_bus: subscriber {} threw: {}", sub->id, e.what());
            report_error({error_kind::subscriber, {}, e.what()});
        }
    }
}

void event_bus::report_error(const monitor_error& err) {
    std::lock_guard<std::mutex> lock(m_error_mutex);
    for (const auto& handler : m_error_handlers) {
        try {
            handler(err);
        } catch (const std::exception& e) {
            m_log->warn("event_bus: error handler threw: {}", e.what());
        }
    }
}

std::size_t event_bus::subscriber_count() const {
    return std::atomic_load(&m_snapshot)->size();
}

} // namespace session_tail
