#pragma once

#include "config.hpp"
#include "line_framer.hpp"
#include "record.hpp"
#include <spdlog/spdlog.h>
#include <atomic>
#include <chrono>
#include <cstdint>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <unordered_map>
#include <vector>

namespace session_tail {

// One JSONL file being tailed.
// cursor is only touched while read_mutex is held; readers use try_lock and
// drop the trigger if another read of the same file is in flight.
struct tracked_file {
    std::string path;
    bool is_primary = false;
    std::string agent_id;   // from "agent-<id>.jsonl", empty otherwise
    uint64_t epoch = 0;     // file_tracker::begin() generation that adopted it

    std::mutex read_mutex;
    tail_cursor cursor;

    std::atomic<bool> read_queued{false};
    bool error_reported = false;  // guarded by read_mutex
};

// Discovers and owns the set of tailed files for one monitoring session.
// All methods are thread-safe.
class file_tracker {
public:
    file_tracker(const config& cfg, std::shared_ptr<spdlog::logger> log);

    // Reset for a new session: forget all files, set the watch start instant.
    void begin(timestamp watch_start);

    // Directory scanned for *.jsonl files; empty disables scanning.
    void set_directory(const std::string& dir);
    std::string directory() const;

    // Explicit-session mode: only the named session file and agent-*
    // sidecars are tracked; other sessions sharing the directory are ignored.
    void restrict_to_session(const std::string& session_id);

    // Track path if it is a *.jsonl directly inside the target directory,
    // created within the tolerance window (or any age with
    // include_existing_content). Idempotent; returns the tracked file, or
    // nullptr if rejected. Nothing is tracked before set_directory().
    std::shared_ptr<tracked_file> track(const std::string& path);

    // Track path unconditionally. With from_end, content already in the file
    // is skipped.
    std::shared_ptr<tracked_file> adopt(const std::string& path, bool from_end);

    // List the directory and track() every candidate. Errors are swallowed;
    // returns the number of newly tracked files.
    std::size_t scan();

    std::vector<std::shared_ptr<tracked_file>> files() const;
    std::size_t file_count() const;

    std::optional<std::string> session_id() const;
    std::optional<std::string> primary_path() const;

    uint64_t epoch() const { return m_epoch.load(); }

    timestamp watch_start() const;

    // "agent-<id>.jsonl" naming of sub-agent sidecar files.
    static bool is_sub_agent_file(const std::string& path);
    static std::string agent_id_from_path(const std::string& path);

    // Birth time where the filesystem records it, else last modification.
    static std::optional<timestamp> creation_time(const std::string& path);

    // Find "<session_id>.jsonl" anywhere below root.
    static std::optional<std::string> locate_session_file(const std::string& root,
                                                          const std::string& session_id);

private:
    std::shared_ptr<tracked_file> adopt_locked(const std::string& path, bool from_end);
    bool within_tolerance(const std::string& path) const;

    const config m_cfg;
    std::shared_ptr<spdlog::logger> m_log;

    mutable std::mutex m_mutex;
    std::string m_directory;
    std::string m_only_session;
    timestamp m_watch_start{};
    std::unordered_map<std::string, std::shared_ptr<tracked_file>> m_files;
    std::optional<std::string> m_session_id;
    std::optional<std::string> m_primary_path;

    std::atomic<uint64_t> m_epoch{0};
};

} // namespace session_tail
