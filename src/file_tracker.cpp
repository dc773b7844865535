#include "file_tracker.hpp"
#include <fcntl.h>
#include <sys/stat.h>
#include <filesystem>
#include <system_error>

namespace fs = std::filesystem;

namespace session_tail {

namespace {

constexpr const char* kAgentPrefix = "agent-";

bool is_jsonl(const fs::path& p) {
    return p.extension() == ".jsonl";
}

timestamp to_timestamp(const struct statx_timestamp& t) {
    auto since_epoch = std::chrono::seconds(t.tv_sec) + std::chrono::nanoseconds(t.tv_nsec);
    return timestamp(std::chrono::duration_cast<timestamp::duration>(since_epoch));
}

} // anonymous namespace

file_tracker::file_tracker(const config& cfg, std::shared_ptr<spdlog::logger> log)
    : m_cfg(cfg), m_log(std::move(log))
{}

void file_tracker::begin(timestamp watch_start) {
    std::lock_guard<std::mutex> lock(m_mutex);
    m_watch_start = watch_start;
    m_files.clear();
    m_directory.clear();
    m_only_session.clear();
    m_session_id.reset();
    m_primary_path.reset();
    m_epoch.fetch_add(1);
}

void file_tracker::set_directory(const std::string& dir) {
    std::lock_guard<std::mutex> lock(m_mutex);
    m_directory = dir;
}

std::string file_tracker::directory() const {
    std::lock_guard<std::mutex> lock(m_mutex);
    return m_directory;
}

void file_tracker::restrict_to_session(const std::string& session_id) {
    std::lock_guard<std::mutex> lock(m_mutex);
    m_only_session = session_id;
}

timestamp file_tracker::watch_start() const {
    std::lock_guard<std::mutex> lock(m_mutex);
    return m_watch_start;
}

bool file_tracker::within_tolerance(const std::string& path) const {
    if (m_cfg.include_existing_content) return true;

    auto created = creation_time(path);
    if (!created) return false;

    auto earliest = m_watch_start - std::chrono::seconds(m_cfg.new_file_tolerance_seconds);
    return *created >= earliest;
}

std::shared_ptr<tracked_file> file_tracker::track(const std::string& path) {
    std::lock_guard<std::mutex> lock(m_mutex);

    auto it = m_files.find(path);
    if (it != m_files.end()) return it->second;

    if (!is_jsonl(path)) return nullptr;

    // Only direct children of the target directory
    if (m_directory.empty() || fs::path(path).parent_path() != fs::path(m_directory)) {
        return nullptr;
    }

    if (!m_only_session.empty() && !is_sub_agent_file(path) &&
        fs::path(path).stem().string() != m_only_session) {
        return nullptr;
    }

    if (!within_tolerance(path)) return nullptr;

    return adopt_locked(path, false);
}

std::shared_ptr<tracked_file> file_tracker::adopt(const std::string& path, bool from_end) {
    std::lock_guard<std::mutex> lock(m_mutex);

    auto it = m_files.find(path);
    if (it != m_files.end()) return it->second;
    return adopt_locked(path, from_end);
}

std::shared_ptr<tracked_file> file_tracker::adopt_locked(const std::string& path, bool from_end) {
    auto file = std::make_shared<tracked_file>();
    file->path = path;
    file->epoch = m_epoch.load();

    if (from_end) {
        try {
            file->cursor.seek_to_end(path);
        } catch (const std::exception& e) {
            m_log->debug("file_tracker: cannot size '{}', reading from start: {}", path, e.what());
        }
    }

    if (is_sub_agent_file(path)) {
        file->agent_id = agent_id_from_path(path);
    } else if (!m_primary_path) {
        // First non-agent file fixes the session
        file->is_primary = true;
        m_primary_path = path;
        m_session_id = fs::path(path).stem().string();
        m_log->info("file_tracker: primary session file '{}' (session {})", path, *m_session_id);
    }

    m_files.emplace(path, file);
    m_log->debug("file_tracker: tracking '{}' ({}, offset {})",
                 path, file->is_primary ? "primary" : "sidecar", file->cursor.offset());
    return file;
}

std::size_t file_tracker::scan() {
    auto dir = directory();
    if (dir.empty()) return 0;

    std::error_code ec;
    if (!fs::is_directory(dir, ec)) return 0;

    std::vector<std::string> candidates;
    for (fs::directory_iterator it(dir, ec), end; !ec && it != end; it.increment(ec)) {
        std::error_code entry_ec;
        if (!it->is_regular_file(entry_ec) || entry_ec) continue;
        if (!is_jsonl(it->path())) continue;
        candidates.push_back(it->path().string());
    }
    if (ec) {
        m_log->debug("file_tracker: scan of '{}' interrupted: {}", dir, ec.message());
    }

    std::size_t added = 0;
    for (const auto& path : candidates) {
        auto before = file_count();
        if (track(path) && file_count() > before) ++added;
    }
    return added;
}

std::vector<std::shared_ptr<tracked_file>> file_tracker::files() const {
    std::lock_guard<std::mutex> lock(m_mutex);
    std::vector<std::shared_ptr<tracked_file>> out;
    out.reserve(m_files.size());
    for (const auto& [path, file] : m_files) out.push_back(file);
    return out;
}

std::size_t file_tracker::file_count() const {
    std::lock_guard<std::mutex> lock(m_mutex);
    return m_files.size();
}

std::optional<std::string> file_tracker::session_id() const {
    std::lock_guard<std::mutex> lock(m_mutex);
    return m_session_id;
}

std::optional<std::string> file_tracker::primary_path() const {
    std::lock_guard<std::mutex> lock(m_mutex);
    return m_primary_path;
}

bool file_tracker::is_sub_agent_file(const std::string& path) {
    return fs::path(path).stem().string().rfind(kAgentPrefix, 0) == 0;
}

std::string file_tracker::agent_id_from_path(const std::string& path) {
    auto stem = fs::path(path).stem().string();
    if (stem.rfind(kAgentPrefix, 0) != 0) return {};
    return stem.substr(std::char_traits<char>::length(kAgentPrefix));
}

std::optional<timestamp> file_tracker::creation_time(const std::string& path) {
    struct statx stx{};
    if (::statx(AT_FDCWD, path.c_str(), AT_STATX_SYNC_AS_STAT,
                STATX_BTIME | STATX_MTIME, &stx) != 0) {
        return std::nullopt;
    }
    if (stx.stx_mask & STATX_BTIME) return to_timestamp(stx.stx_btime);
    if (stx.stx_mask & STATX_MTIME) return to_timestamp(stx.stx_mtime);
    return std::nullopt;
}

std::optional<std::string> file_tracker::locate_session_file(const std::string& root,
                                                             const std::string& session_id) {
    std::error_code ec;
    if (session_id.empty() || !fs::is_directory(root, ec)) return std::nullopt;

    const std::string wanted = session_id + ".jsonl";
    fs::recursive_directory_iterator it(root, fs::directory_options::skip_permission_denied, ec);
    for (fs::recursive_directory_iterator end; !ec && it != end; it.increment(ec)) {
        if (it->path().filename() == wanted) return it->path().string();
    }
    return std::nullopt;
}

} // namespace session_tail
