#pragma once

#include <chrono>
#include <cstddef>
#include <cstdint>
#include <optional>
#include <string>

namespace session_tail {

struct config {
    // Where to look - at least one of working_directory / session_id
    std::string working_directory;  // derives <log_root>/<sanitized path>
    std::string session_id;         // bypasses directory discovery
    std::string log_root;           // defaults to ~/.claude/projects if empty

    // Tailing behaviour
    bool include_existing_content = false;
    int new_file_tolerance_seconds = 2;
    uint32_t poll_interval_ms = 100;
    std::size_t max_read_bytes = 1024 * 1024;  // per file per tick
    std::size_t dedup_capacity = 100000;

    // Operational
    unsigned int read_threads = 2;
    int stats_interval_seconds = 10;
    std::string log_level = "info";
};

// Parse config from YAML file. Throws on error. Not validated, so that
// command line overrides can fill in before validate_config().
config load_config(const std::string& path);

// Throws std::runtime_error when the config cannot start a monitor.
void validate_config(const config& cfg);

// Effective log root: cfg.log_root, or $HOME/.claude/projects.
std::string resolve_log_root(const config& cfg);

// Replace '/', '\' and '.' with '-' so "/home/me/my.app" -> "-home-me-my-app".
std::string sanitize_project_path(const std::string& working_directory);

// <log_root>/<sanitized working dir>, or nullopt without a working directory.
std::optional<std::string> derive_project_directory(const config& cfg);

std::chrono::milliseconds poll_interval(const config& cfg);

} // namespace session_tail
