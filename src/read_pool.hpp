#pragma once

#include "file_tracker.hpp"
#include <concurrentqueue/moodycamel/blockingconcurrentqueue.h>
#include <spdlog/spdlog.h>
#include <atomic>
#include <cstdint>
#include <functional>
#include <memory>
#include <thread>
#include <vector>

namespace session_tail {

// Worker threads that perform file reads off the asio thread.
// Reads of different files proceed in parallel; a file already queued is not
// queued twice.
class read_pool {
public:
    using read_fn = std::function<void(tracked_file&)>;

    struct stats {
        uint64_t requested = 0;
        uint64_t coalesced = 0;  // trigger dropped, file already queued
        uint64_t completed = 0;
        std::size_t queue_depth = 0;
    };

    read_pool(unsigned int thread_count, read_fn reader,
              std::shared_ptr<spdlog::logger> log);
    ~read_pool();

    // Spawn the worker threads. No-op if already running.
    void start();

    // Signal workers to stop and join them. Queued reads are abandoned;
    // offsets are untouched because nothing was read for them.
    void stop();

    // Queue a read of file unless one is already queued.
    void request(std::shared_ptr<tracked_file> file);

    bool running() const { return m_running.load(); }

    stats get_stats() const;

private:
    void worker_loop(unsigned int worker_id);

    unsigned int m_thread_count;
    read_fn m_reader;
    std::shared_ptr<spdlog::logger> m_log;

    std::atomic<bool> m_running{false};
    moodycamel::BlockingConcurrentQueue<std::shared_ptr<tracked_file>> m_queue;
    std::vector<std::thread> m_threads;

    std::atomic<uint64_t> m_requested{0};
    std::atomic<uint64_t> m_coalesced{0};
    std::atomic<uint64_t> m_completed{0};
};

} // namespace session_tail
