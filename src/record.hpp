#pragma once

#include <nlohmann/json.hpp>
#include <chrono>
#include <cstdint>
#include <optional>
#include <string>
#include <variant>
#include <vector>

namespace session_tail {

using timestamp = std::chrono::system_clock::time_point;

enum class record_type {
    assistant,
    user,
    system,
    summary,
    file_history_snapshot
};

// Fields every log line may carry.
struct record_header {
    record_type type = record_type::user;
    std::string timestamp_text;             // as written, ISO-8601
    std::optional<timestamp> time;          // parsed timestamp_text
    std::string session_id;
    std::string uuid;
    std::optional<std::string> parent_uuid; // nullopt for thread roots
    std::optional<std::string> agent_id;    // sub-agent records only
    bool is_sub_agent = false;

    std::string cwd;
    std::string version;
    std::string git_branch;
};

// --- Assistant content blocks ---

struct tool_use_block {
    std::string id;
    std::string name;
    nlohmann::json input;  // opaque, not validated
};

struct text_block {
    std::string text;
};

struct thinking_block {
    std::string text;
};

using content_block = std::variant<tool_use_block, text_block, thinking_block>;

struct token_usage {
    uint64_t input_tokens = 0;
    uint64_t output_tokens = 0;
    uint64_t cache_read_input_tokens = 0;
    uint64_t cache_creation_input_tokens = 0;
    uint64_t web_search_requests = 0;
    uint64_t web_fetch_requests = 0;

    uint64_t total_tokens() const { return input_tokens + output_tokens; }

    // cache_read / (input + cache_read); 0 when there was no input.
    double cache_hit_rate() const {
        auto total = input_tokens + cache_read_input_tokens;
        return total > 0 ? static_cast<double>(cache_read_input_tokens) / static_cast<double>(total) : 0.0;
    }
};

struct assistant_record {
    record_header header;
    std::string message_id;
    std::string request_id;
    std::string model;
    std::vector<content_block> content;
    std::optional<token_usage> usage;
    std::optional<std::string> stop_reason;
    std::optional<bool> context_truncated;
};

// --- User ---

struct tool_result_block {
    std::string tool_use_id;
    std::string content;
    bool is_error = false;

    bool success() const { return !is_error; }
};

struct todo_item {
    std::string content;
    std::string status;       // pending | in_progress | completed
    std::string active_form;
};

// Present when the line carries "toolUseResult".
struct tool_execution_info {
    bool has_stdout = false;
    bool has_stderr = false;
    bool interrupted = false;
    bool is_image = false;
};

struct user_record {
    record_header header;
    // Plain prompt text, or the tool results this message returns.
    std::variant<std::string, std::vector<tool_result_block>> content;
    std::optional<std::vector<todo_item>> todos;
    std::optional<tool_execution_info> tool_execution;

    const std::vector<tool_result_block>* tool_results() const {
        return std::get_if<std::vector<tool_result_block>>(&content);
    }
};

// --- System / summary / file history ---

struct system_record {
    record_header header;
    std::string subtype;
    std::string content;
    std::string level;

    bool is_error() const { return level == "error"; }
};

struct summary_record {
    record_header header;
    std::string summary;
    std::string leaf_uuid;
};

struct file_backup {
    std::string original_path;
    std::string backup_file_name;
    int version = 0;
    std::string backup_time_text;
    std::optional<timestamp> backup_time;
};

struct file_history_snapshot_record {
    record_header header;
    std::string message_id;
    bool is_snapshot_update = false;
    std::vector<file_backup> backups;
};

using record = std::variant<assistant_record,
                            user_record,
                            system_record,
                            summary_record,
                            file_history_snapshot_record>;

// Header of whichever alternative r holds.
const record_header& header_of(const record& r);
record_header& header_of(record& r);

const char* to_string(record_type type);

} // namespace session_tail
