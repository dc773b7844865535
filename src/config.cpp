#include "config.hpp"
#include <yaml-cpp/yaml.h>
#include <cstdlib>
#include <filesystem>
#include <stdexcept>

namespace session_tail {

config load_config(const std::string& path) {
    YAML::Node root = YAML::LoadFile(path);
    config cfg;

    // Target
    if (auto n = root["working_directory"]) cfg.working_directory = n.as<std::string>();
    if (auto n = root["session_id"])        cfg.session_id = n.as<std::string>();
    if (auto n = root["log_root"])          cfg.log_root = n.as<std::string>();

    // Tailing
    if (auto n = root["include_existing_content"])   cfg.include_existing_content = n.as<bool>();
    if (auto n = root["new_file_tolerance_seconds"]) cfg.new_file_tolerance_seconds = n.as<int>();
    if (auto n = root["poll_interval_ms"])           cfg.poll_interval_ms = n.as<uint32_t>();
    if (auto n = root["max_read_bytes"])             cfg.max_read_bytes = n.as<std::size_t>();
    if (auto n = root["dedup_capacity"])             cfg.dedup_capacity = n.as<std::size_t>();

    // Operational
    if (auto n = root["read_threads"])           cfg.read_threads = n.as<unsigned int>();
    if (auto n = root["stats_interval_seconds"]) cfg.stats_interval_seconds = n.as<int>();
    if (auto n = root["log_level"])              cfg.log_level = n.as<std::string>();

    return cfg;
}

void validate_config(const config& cfg) {
    if (cfg.working_directory.empty() && cfg.session_id.empty()) {
        throw std::runtime_error("config: one of 'working_directory' or 'session_id' is required");
    }
    if (cfg.new_file_tolerance_seconds < 0) {
        throw std::runtime_error("config: 'new_file_tolerance_seconds' must not be negative");
    }
    if (cfg.poll_interval_ms == 0) {
        throw std::runtime_error("config: 'poll_interval_ms' must be positive");
    }
    if (cfg.max_read_bytes == 0) {
        throw std::runtime_error("config: 'max_read_bytes' must be positive");
    }
    if (cfg.dedup_capacity == 0) {
        throw std::runtime_error("config: 'dedup_capacity' must be positive");
    }
    if (cfg.stats_interval_seconds <= 0) {
        throw std::runtime_error("config: 'stats_interval_seconds' must be positive");
    }
}

std::string resolve_log_root(const config& cfg) {
    if (!cfg.log_root.empty()) return cfg.log_root;

    const char* home = std::getenv("HOME");
    std::filesystem::path base = home ? home : ".";
    return (base / ".claude" / "projects").string();
}

std::string sanitize_project_path(const std::string& working_directory) {
    std::string out = working_directory;
    for (auto& c : out) {
        if (c == '/' || c == '\\' || c == '.') c = '-';
    }
    return out;
}

std::optional<std::string> derive_project_directory(const config& cfg) {
    if (cfg.working_directory.empty()) return std::nullopt;
    std::filesystem::path root = resolve_log_root(cfg);
    return (root / sanitize_project_path(cfg.working_directory)).string();
}

std::chrono::milliseconds poll_interval(const config& cfg) {
    return std::chrono::milliseconds(cfg.poll_interval_ms);
}

} // namespace session_tail
