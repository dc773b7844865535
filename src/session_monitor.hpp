#pragma once

#include "config.hpp"
#include "dedup_cache.hpp"
#include "dir_watcher.hpp"
#include "event_bus.hpp"
#include "file_tracker.hpp"
#include "read_pool.hpp"
#include <asio/awaitable.hpp>
#include <asio/io_context.hpp>
#include <spdlog/spdlog.h>
#include <atomic>
#include <cstdint>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

namespace session_tail {

enum class monitor_state {
    stopped,
    starting,
    watching
};

const char* to_string(monitor_state state);

// Tails the JSONL logs of one agent session and emits typed records.
//
// Two producers drive reads: a fixed-interval poll loop and inotify change
// notifications. Both go through track() + request_read(); the read itself
// runs on the read pool, and framing / parsing / dedup / publish happen inline
// on the reading thread. Acceptance into the dedup set and publication to the
// bus are one critical section, so subscribers observe records in acceptance
// order.
//
// The io_context must not run after the monitor is destroyed.
class session_monitor {
public:
    struct stats {
        uint64_t lines = 0;
        uint64_t records = 0;       // published
        uint64_t duplicates = 0;
        uint64_t parse_failures = 0;
        uint64_t unknown_types = 0;
        uint64_t truncations = 0;
        uint64_t bytes = 0;
        std::size_t tracked_files = 0;
        std::size_t seen_keys = 0;
        read_pool::stats reads;
    };

    session_monitor(asio::io_context& ioc, const config& cfg,
                    std::shared_ptr<spdlog::logger> log);
    ~session_monitor();

    session_monitor(const session_monitor&) = delete;
    session_monitor& operator=(const session_monitor&) = delete;

    // Begin watching. Call before the agent process starts. No-op unless
    // stopped. Watch setup failures are reported as engine_fatal and the
    // monitor continues polling-only.
    void start();

    // Cancel the poll loop and tear down watches. No-op when stopped.
    void stop();

    // Handlers run on a read thread, inside the accept critical section, and
    // must not call start() or stop(). read_now() from a handler returns 0.
    subscription subscribe(record_handler handler);
    void on_error(error_handler handler);

    // Session id once the primary file is known.
    std::optional<std::string> session_id() const;

    monitor_state state() const { return m_state.load(); }

    // One discovery + read pass over every tracked file on the calling
    // thread. Returns the number of records published; 0 when stopped or
    // when called from a record handler.
    std::size_t read_now();

    std::vector<std::string> tracked_paths() const;

    stats get_stats() const;

private:
    asio::awaitable<void> poll_loop(uint64_t generation);

    // Poll path: discovery, then a read request for every tracked file.
    void tick();

    // Resolve the target directory / session file and scan it.
    void discover();
    std::optional<monitor_error> discover_locked();

    // Watch failures other than "directory not created yet" are reported
    // once per start() as engine_fatal; polling carries on regardless.
    void setup_watches();
    std::optional<monitor_error> watch_directory(const std::string& dir);
    std::optional<monitor_error> watch_failure(const std::string& path, const std::string& message);
    void report_watch_failure(const std::optional<monitor_error>& failure);

    // Notification path.
    void on_fs_event(const std::string& dir, const std::string& name, bool is_dir);

    void request_read(std::shared_ptr<tracked_file> file);

    // Returns the number of records published.
    std::size_t read_file(tracked_file& file);
    bool process_line(tracked_file& file, const std::string& line);

    asio::io_context& m_ioc;
    const config m_cfg;
    std::shared_ptr<spdlog::logger> m_log;

    std::shared_ptr<event_bus> m_bus;
    dedup_cache m_seen;
    file_tracker m_tracker;
    read_pool m_pool;
    std::shared_ptr<dir_watcher> m_watcher;

    std::atomic<monitor_state> m_state{monitor_state::stopped};
    std::atomic<uint64_t> m_generation{0};

    // start()/stop()/discover() bookkeeping
    mutable std::mutex m_control_mutex;
    std::string m_log_root;
    std::optional<std::string> m_project_dir;
    bool m_session_located = false;
    bool m_root_watched = false;            // log root watched for the project dir
    bool m_watch_failure_reported = false;

    // dedup + publish as one step
    std::mutex m_accept_mutex;

    std::atomic<uint64_t> m_lines{0};
    std::atomic<uint64_t> m_records{0};
    std::atomic<uint64_t> m_duplicates{0};
    std::atomic<uint64_t> m_parse_failures{0};
    std::atomic<uint64_t> m_unknown_types{0};
    std::atomic<uint64_t> m_truncations{0};
    std::atomic<uint64_t> m_bytes{0};
};

} // namespace session_tail
