#include "session_monitor.hpp"
#include "record_parser.hpp"
#include <asio/co_spawn.hpp>
#include <asio/detached.hpp>
#include <asio/post.hpp>
#include <asio/steady_timer.hpp>
#include <asio/this_coro.hpp>
#include <asio/use_awaitable.hpp>
#include <filesystem>
#include <system_error>

namespace fs = std::filesystem;

namespace session_tail {

namespace {

// Monitor whose accept section the current thread is inside
thread_local const session_monitor* t_accepting = nullptr;

} // namespace

const char* to_string(monitor_state state) {
    switch (state) {
        case monitor_state::stopped:  return "stopped";
        case monitor_state::starting: return "starting";
        case monitor_state::watching: return "watching";
    }
    return "unknown";
}

session_monitor::session_monitor(asio::io_context& ioc, const config& cfg,
                                 std::shared_ptr<spdlog::logger> log)
    : m_ioc(ioc), m_cfg(cfg), m_log(std::move(log)),
      m_bus(std::make_shared<event_bus>(m_log)),
      m_seen(cfg.dedup_capacity),
      m_tracker(cfg, m_log),
      m_pool(cfg.read_threads, [this](tracked_file& file) { read_file(file); }, m_log)
{}

session_monitor::~session_monitor() {
    stop();
}

void session_monitor::start() {
    auto expected = monitor_state::stopped;
    if (!m_state.compare_exchange_strong(expected, monitor_state::starting)) return;

    uint64_t generation = ++m_generation;

    {
        std::lock_guard<std::mutex> lock(m_control_mutex);
        m_log_root = resolve_log_root(m_cfg);
        // An explicit session id wins over the working directory
        m_project_dir = m_cfg.session_id.empty() ? derive_project_directory(m_cfg) : std::nullopt;
        m_session_located = false;
        m_root_watched = false;
        m_watch_failure_reported = false;
    }
    m_tracker.begin(std::chrono::system_clock::now());

    setup_watches();

    try {
        discover();
    } catch (const std::exception& e) {
        // Retried by the poll loop
        m_log->debug("Initial discovery failed: {}", e.what());
    }

    m_pool.start();
    m_state.store(monitor_state::watching);

    asio::co_spawn(m_ioc, poll_loop(generation), asio::detached);

    if (!m_cfg.session_id.empty()) {
        m_log->info("Monitoring session {} under '{}' (poll={}ms)",
                    m_cfg.session_id, m_log_root, m_cfg.poll_interval_ms);
    } else {
        m_log->info("Monitoring '{}' (poll={}ms, tolerance={}s)",
                    m_project_dir.value_or("<none>"), m_cfg.poll_interval_ms,
                    m_cfg.new_file_tolerance_seconds);
    }
}

void session_monitor::stop() {
    auto previous = m_state.exchange(monitor_state::stopped);
    if (previous == monitor_state::stopped) return;

    ++m_generation;  // ends the poll loop and mutes late notifications

    std::shared_ptr<dir_watcher> watcher;
    {
        std::lock_guard<std::mutex> lock(m_control_mutex);
        watcher = std::move(m_watcher);
    }
    if (watcher) {
        // The descriptor belongs to the io_context thread
        asio::post(m_ioc, [watcher] { watcher->close(); });
    }

    m_pool.stop();
    m_log->info("Monitoring stopped ({} records emitted)", m_records.load());
}

subscription session_monitor::subscribe(record_handler handler) {
    return m_bus->subscribe(std::move(handler));
}

void session_monitor::on_error(error_handler handler) {
    m_bus->on_error(std::move(handler));
}

std::optional<std::string> session_monitor::session_id() const {
    return m_tracker.session_id();
}

void session_monitor::setup_watches() {
    uint64_t generation = m_generation.load();
    std::optional<monitor_error> failure;

    {
        std::lock_guard<std::mutex> lock(m_control_mutex);
        try {
            auto watcher = std::make_shared<dir_watcher>(m_ioc, m_log);
            watcher->open([this, generation](const std::string& dir, const std::string& name, bool is_dir) {
                if (m_generation.load() != generation) return;
                on_fs_event(dir, name, is_dir);
            });
            asio::co_spawn(m_ioc, watcher->run(), asio::detached);
            m_watcher = std::move(watcher);
        } catch (const std::exception& e) {
            failure = watch_failure(m_log_root, e.what());
        }

        // Until the project directory exists, watch its parent for it
        std::error_code ec;
        if (m_watcher && m_project_dir && !fs::is_directory(*m_project_dir, ec)) {
            auto root_failure = watch_directory(m_log_root);
            if (!root_failure) m_root_watched = m_watcher->is_watching(m_log_root);
            if (!failure) failure = std::move(root_failure);
        }
    }

    report_watch_failure(failure);
}

std::optional<monitor_error> session_monitor::watch_failure(const std::string& path,
                                                            const std::string& message) {
    // m_control_mutex held by caller; one report per start()
    if (m_watch_failure_reported) return std::nullopt;
    m_watch_failure_reported = true;
    return monitor_error{error_kind::engine_fatal, path, message};
}

void session_monitor::report_watch_failure(const std::optional<monitor_error>& failure) {
    if (!failure) return;
    m_log->warn("File notifications unavailable for '{}', polling only: {}",
                failure->path, failure->message);
    m_bus->report_error(*failure);
}

std::optional<monitor_error> session_monitor::watch_directory(const std::string& dir) {
    // m_control_mutex held by caller
    if (!m_watcher || m_watcher->is_watching(dir)) return std::nullopt;

    auto ec = m_watcher->add_watch(dir);
    if (!ec || ec == std::errc::no_such_file_or_directory) return std::nullopt;  // created later
    return watch_failure(dir, "inotify_add_watch: " + ec.message());
}

void session_monitor::discover() {
    std::optional<monitor_error> failure;
    {
        std::lock_guard<std::mutex> lock(m_control_mutex);
        failure = discover_locked();
    }
    report_watch_failure(failure);
}

std::optional<monitor_error> session_monitor::discover_locked() {
    if (!m_cfg.session_id.empty()) {
        if (!m_session_located) {
            auto path = file_tracker::locate_session_file(m_log_root, m_cfg.session_id);
            if (!path) return std::nullopt;  // not written yet

            // Found at start: existing content predates us unless asked for.
            // Found later: the file is new, read it whole.
            bool at_start = m_state.load() == monitor_state::starting;
            bool from_end = at_start && !m_cfg.include_existing_content;

            auto dir = fs::path(*path).parent_path().string();
            m_tracker.restrict_to_session(m_cfg.session_id);
            m_tracker.set_directory(dir);
            m_tracker.adopt(*path, from_end);
            m_project_dir = dir;
            m_session_located = true;
            m_log->info("Located session file '{}'", *path);
        }
    } else if (m_project_dir) {
        std::error_code ec;
        if (!fs::is_directory(*m_project_dir, ec)) return std::nullopt;  // still waiting for creation
        if (m_tracker.directory().empty()) {
            m_tracker.set_directory(*m_project_dir);
            m_log->info("Project directory '{}' available", *m_project_dir);
        }
    } else {
        return std::nullopt;
    }

    auto failure = watch_directory(*m_project_dir);
    if (m_root_watched && m_watcher && m_watcher->is_watching(*m_project_dir)) {
        m_watcher->remove_watch(m_log_root);
        m_root_watched = false;
    }
    m_tracker.scan();
    return failure;
}

asio::awaitable<void> session_monitor::poll_loop(uint64_t generation) {
    asio::steady_timer timer(co_await asio::this_coro::executor);

    while (m_generation.load() == generation) {
        try {
            tick();
        } catch (const std::exception& e) {
            m_log->warn("Poll tick failed: {}", e.what());
        }

        timer.expires_after(poll_interval(m_cfg));
        co_await timer.async_wait(asio::use_awaitable);
    }
    m_log->debug("Poll loop {} finished", generation);
}

void session_monitor::tick() {
    try {
        discover();
    } catch (const std::exception& e) {
        m_log->debug("Discovery failed, retrying next tick: {}", e.what());
    }

    for (auto& file : m_tracker.files()) {
        request_read(std::move(file));
    }
}

void session_monitor::on_fs_event(const std::string& dir, const std::string& name, bool is_dir) {
    if (m_state.load() != monitor_state::watching) return;

    // Queue overflow or a new directory: fall back to a full pass
    if (name.empty() || is_dir) {
        tick();
        return;
    }

    auto path = (fs::path(dir) / name).string();
    if (auto file = m_tracker.track(path)) {
        request_read(std::move(file));
    }
}

void session_monitor::request_read(std::shared_ptr<tracked_file> file) {
    if (!m_pool.running()) return;
    m_pool.request(std::move(file));
}

std::size_t session_monitor::read_now() {
    if (m_state.load() != monitor_state::watching) return 0;
    if (t_accepting == this) {
        m_log->warn("read_now() called from a record handler, ignored");
        return 0;
    }

    try {
        discover();
    } catch (const std::exception& e) {
        m_log->debug("Discovery failed: {}", e.what());
    }

    std::size_t published = 0;
    for (const auto& file : m_tracker.files()) {
        published += read_file(*file);
    }
    return published;
}

std::size_t session_monitor::read_file(tracked_file& file) {
    if (m_state.load() == monitor_state::stopped) return 0;
    if (file.epoch != m_tracker.epoch()) return 0;  // from a previous session

    std::unique_lock<std::mutex> lock(file.read_mutex, std::try_to_lock);
    if (!lock.owns_lock()) return 0;  // read in flight; next tick catches up

    tail_cursor::read_result result;
    try {
        result = file.cursor.read_from(file.path, m_cfg.max_read_bytes);
    } catch (const std::system_error& e) {
        if (e.code() == std::errc::no_such_file_or_directory) return 0;
        if (!file.error_reported) {
            file.error_reported = true;
            m_log->warn("Read of '{}' failed: {}", file.path, e.what());
            m_bus->report_error({error_kind::io, file.path, e.what()});
        }
        return 0;
    } catch (const std::exception& e) {
        if (!file.error_reported) {
            file.error_reported = true;
            m_log->warn("Read of '{}' failed: {}", file.path, e.what());
            m_bus->report_error({error_kind::io, file.path, e.what()});
        }
        return 0;
    }
    file.error_reported = false;

    if (result.truncated) {
        m_truncations.fetch_add(1, std::memory_order_relaxed);
        m_log->info("'{}' shrank below its read offset, restarting from the beginning", file.path);
    }
    m_bytes.fetch_add(result.bytes_read, std::memory_order_relaxed);

    std::size_t published = 0;
    for (const auto& line : result.lines) {
        if (process_line(file, line)) ++published;
    }
    return published;
}

bool session_monitor::process_line(tracked_file& file, const std::string& line) {
    m_lines.fetch_add(1, std::memory_order_relaxed);

    std::optional<record> rec;
    try {
        rec = parse_record(line);
    } catch (const record_parse_error& e) {
        // Consumed either way: the offset has already moved past this line
        m_parse_failures.fetch_add(1, std::memory_order_relaxed);
        m_log->debug("Malformed line in '{}': {}", file.path, e.what());
        m_bus->report_error({error_kind::parse, file.path, e.what()});
        return false;
    }

    if (!rec) {
        m_unknown_types.fetch_add(1, std::memory_order_relaxed);
        return false;
    }

    auto& header = header_of(*rec);
    if (!file.is_primary) {
        header.is_sub_agent = true;
        if (!header.agent_id && !file.agent_id.empty()) header.agent_id = file.agent_id;
    }

    auto key = make_seen_key(*rec, line);

    std::lock_guard<std::mutex> accept(m_accept_mutex);
    if (!m_seen.try_mark_seen(key)) {
        m_duplicates.fetch_add(1, std::memory_order_relaxed);
        return false;
    }
    t_accepting = this;
    m_bus->publish(*rec);
    t_accepting = nullptr;
    m_records.fetch_add(1, std::memory_order_relaxed);
    return true;
}

std::vector<std::string> session_monitor::tracked_paths() const {
    std::vector<std::string> paths;
    for (const auto& file : m_tracker.files()) paths.push_back(file->path);
    return paths;
}

session_monitor::stats session_monitor::get_stats() const {
    stats s;
    s.lines = m_lines.load(std::memory_order_relaxed);
    s.records = m_records.load(std::memory_order_relaxed);
    s.duplicates = m_duplicates.load(std::memory_order_relaxed);
    s.parse_failures = m_parse_failures.load(std::memory_order_relaxed);
    s.unknown_types = m_unknown_types.load(std::memory_order_relaxed);
    s.truncations = m_truncations.load(std::memory_order_relaxed);
    s.bytes = m_bytes.load(std::memory_order_relaxed);
    s.tracked_files = m_tracker.file_count();
    s.seen_keys = m_seen.size();
    s.reads = m_pool.get_stats();
    return s;
}

} // namespace session_tail
