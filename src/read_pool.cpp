#include "read_pool.hpp"
#include <chrono>

namespace session_tail {

read_pool::read_pool(unsigned int thread_count, read_fn reader,
                     std::shared_ptr<spdlog::logger> log)
    : m_thread_count(thread_count > 0 ? thread_count : 1),
      m_reader(std::move(reader)), m_log(std::move(log))
{}

read_pool::~read_pool() {
    stop();
}

void read_pool::start() {
    if (m_running.exchange(true)) return; // already started

    // Drop anything left over from a previous run
    std::shared_ptr<tracked_file> stale;
    while (m_queue.try_dequeue(stale)) {
        if (stale) stale->read_queued.store(false);
    }

    m_threads.reserve(m_thread_count);
    for (unsigned int i = 0; i < m_thread_count; ++i) {
        m_threads.emplace_back(&read_pool::worker_loop, this, i);
    }
    m_log->debug("Read pool started with {} threads", m_thread_count);
}

void read_pool::stop() {
    if (!m_running.exchange(false)) return; // already stopped

    // Poison pills (null files), one per thread
    for (unsigned int i = 0; i < m_thread_count; ++i) {
        m_queue.enqueue(nullptr);
    }

    for (auto& t : m_threads) {
        if (t.joinable()) t.join();
    }
    m_threads.clear();
    m_log->debug("Read pool stopped");
}

void read_pool::request(std::shared_ptr<tracked_file> file) {
    if (!file) return;
    m_requested.fetch_add(1, std::memory_order_relaxed);

    if (file->read_queued.exchange(true)) {
        m_coalesced.fetch_add(1, std::memory_order_relaxed);
        return;
    }
    m_queue.enqueue(std::move(file));
}

read_pool::stats read_pool::get_stats() const {
    return {
        m_requested.load(std::memory_order_relaxed),
        m_coalesced.load(std::memory_order_relaxed),
        m_completed.load(std::memory_order_relaxed),
        m_queue.size_approx()
    };
}

void read_pool::worker_loop(unsigned int worker_id) {
    m_log->trace("Read worker {} started", worker_id);

    std::shared_ptr<tracked_file> file;
    while (m_running.load(std::memory_order_relaxed)) {
        // Block with timeout to allow checking m_running for graceful shutdown
        bool got = m_queue.wait_dequeue_timed(file, std::chrono::milliseconds(100));
        if (!got) continue;

        // Null file = poison pill
        if (!file) break;

        file->read_queued.store(false);
        try {
            m_reader(*file);
        } catch (const std::exception& e) {
            m_log->warn("Read worker {}: read of '{}' failed: {}", worker_id, file->path, e.what());
        }
        m_completed.fetch_add(1, std::memory_order_relaxed);
        file.reset();
    }

    m_log->trace("Read worker {} stopped", worker_id);
}

} // namespace session_tail
