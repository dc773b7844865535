#pragma once

#include "record.hpp"
#include <chrono>
#include <cstdint>
#include <map>
#include <mutex>
#include <optional>
#include <set>
#include <string>
#include <unordered_map>
#include <vector>

namespace session_tail {

// One tool call and, once it arrives, its result.
struct tool_correlation {
    std::string tool_use_id;
    std::string tool_name;
    std::optional<timestamp> call_time;
    std::optional<timestamp> result_time;
    std::chrono::milliseconds duration{0};
    bool success = false;
    bool completed = false;
};

struct backup_entry {
    std::string message_id;
    file_backup backup;
};

struct system_entry {
    std::string timestamp_text;
    std::string subtype;
    std::string level;
    std::string content;
};

struct agent_group {
    std::string agent_id;
    uint64_t record_count = 0;
    uint64_t tool_calls = 0;
    std::optional<timestamp> first_activity;
    std::optional<timestamp> last_activity;
};

struct session_stats {
    // Records
    std::map<record_type, uint64_t> records_by_type;
    uint64_t total_records = 0;
    uint64_t root_messages = 0;  // no parent uuid
    std::optional<timestamp> first_activity;
    std::optional<timestamp> last_activity;

    // Assistant content
    uint64_t tool_calls = 0;
    uint64_t text_blocks = 0;
    uint64_t thinking_blocks = 0;
    std::map<std::string, uint64_t> tool_usage;   // tool name -> calls
    std::map<std::string, uint64_t> model_usage;  // model -> assistant messages
    std::map<std::string, uint64_t> stop_reasons;
    uint64_t context_truncations = 0;

    // Tokens
    token_usage tokens;
    uint64_t usage_samples = 0;
    double cache_hit_rate_sum = 0.0;

    // Tool results
    uint64_t tool_results = 0;
    uint64_t tool_errors = 0;
    uint64_t unmatched_results = 0;
    uint64_t results_with_stdout = 0;
    uint64_t results_with_stderr = 0;
    uint64_t interrupted_results = 0;
    uint64_t image_results = 0;

    std::unordered_map<std::string, tool_correlation> correlations;
    std::set<std::string> pending_tool_uses;

    // Todos
    std::vector<todo_item> latest_todos;
    uint64_t todo_snapshots = 0;

    // File history
    std::vector<backup_entry> backups;
    std::set<std::string> modified_files;

    // Ledgers
    std::vector<summary_record> summaries;
    std::vector<system_entry> system_events;
    std::vector<system_entry> errors;

    std::map<std::string, agent_group> agents;

    uint64_t count(record_type type) const;
    std::size_t completed_tool_calls() const;
    std::size_t pending_tool_calls() const { return pending_tool_uses.size(); }
    double average_cache_hit_rate() const;
    std::chrono::milliseconds average_tool_duration() const;
    std::chrono::milliseconds max_tool_duration() const;
};

// Folds the record stream into a cumulative view of the session.
// apply() is meant to be called from a single bus subscriber; snapshot() may
// be called from any thread.
class session_aggregator {
public:
    void apply(const record& rec);

    session_stats snapshot() const;

    void reset();

private:
    void count_header(const record_header& header);
    void apply_assistant(const assistant_record& rec);
    void apply_user(const user_record& rec);
    void apply_system(const system_record& rec);
    void apply_summary(const summary_record& rec);
    void apply_file_history(const file_history_snapshot_record& rec);

    mutable std::mutex m_mutex;
    session_stats m_stats;
};

} // namespace session_tail
