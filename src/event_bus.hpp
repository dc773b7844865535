#pragma once

#include "record.hpp"
#include <spdlog/spdlog.h>
#include <atomic>
#include <cstdint>
#include <functional>
#include <memory>
#include <mutex>
#include <string>
#include <vector>

namespace session_tail {

enum class error_kind {
    io,            // read failed mid-way; retried next tick
    parse,         // malformed line, dropped
    subscriber,    // a record handler threw
    engine_fatal   // watch setup failed; running polling-only
};

const char* to_string(error_kind kind);

struct monitor_error {
    error_kind kind;
    std::string path;     // file involved, empty if none
    std::string message;
};

using record_handler = std::function<void(const record&)>;
using error_handler = std::function<void(const monitor_error&)>;

class event_bus;

// Returned by event_bus::subscribe. unsubscribe() is idempotent and may be
// called from inside the handler itself.
class subscription {
public:
    subscription() = default;
    subscription(std::weak_ptr<event_bus> bus, uint64_t id);

    void unsubscribe();

    uint64_t id() const { return m_id; }
    bool active() const;

private:
    std::weak_ptr<event_bus> m_bus;
    uint64_t m_id = 0;
};

// Serialized fan-out of accepted records.
// Subscriber lists are published RCU-style: publish() works on an immutable
// snapshot taken with an atomic load, while subscribe/unsubscribe serialize on
// m_write_mutex and swap in a new snapshot. Deliveries serialize on
// m_delivery_mutex so every subscriber sees one record at a time, in
// acceptance order. Handlers must not call publish() themselves.
class event_bus : public std::enable_shared_from_this<event_bus> {
public:
    explicit event_bus(std::shared_ptr<spdlog::logger> log);

    // Must be owned by a shared_ptr (subscription holds a weak reference).
    subscription subscribe(record_handler handler);

    // Returns true if the subscriber existed. Safe mid-delivery.
    bool unsubscribe(uint64_t id);

    bool is_subscribed(uint64_t id) const;

    void on_error(error_handler handler);

    // Deliver r to every current subscriber.
    void publish(const record& r);

    // Deliver a diagnostic to every error handler.
    void report_error(const monitor_error& err);

    std::size_t subscriber_count() const;
    uint64_t published_count() const { return m_published.load(std::memory_order_relaxed); }

private:
    struct subscriber {
        uint64_t id;
        record_handler handler;
        std::atomic<bool> active{true};
    };

    using subscriber_list = std::vector<std::shared_ptr<subscriber>>;

    void publish_snapshot();

    std::shared_ptr<spdlog::logger> m_log;

    std::mutex m_write_mutex;
    uint64_t m_next_id = 1;
    subscriber_list m_subscribers;                     // writer-only
    std::shared_ptr<const subscriber_list> m_snapshot; // atomic load/store

    std::mutex m_delivery_mutex;

    std::mutex m_error_mutex;
    std::vector<error_handler> m_error_handlers;

    std::atomic<uint64_t> m_published{0};
};

} // namespace session_tail
