#pragma once

#include <asio/awaitable.hpp>
#include <asio/io_context.hpp>
#include <asio/posix/stream_descriptor.hpp>
#include <spdlog/spdlog.h>
#include <functional>
#include <memory>
#include <mutex>
#include <string>
#include <system_error>
#include <unordered_map>

namespace session_tail {

// inotify-backed directory watcher driven by the asio event loop.
//
// Notifications are a latency optimization only: the monitor's poll loop
// rescans on every tick, so a missed or coalesced event costs at most one
// poll interval.
class dir_watcher : public std::enable_shared_from_this<dir_watcher> {
public:
    // dir: watched directory; name: entry inside it (empty on queue
    // overflow, meaning "rescan everything"); is_dir: entry is a directory.
    using callback = std::function<void(const std::string& dir,
                                        const std::string& name,
                                        bool is_dir)>;

    dir_watcher(asio::io_context& ioc, std::shared_ptr<spdlog::logger> log);
    ~dir_watcher();

    // Create the inotify instance. Throws std::system_error on failure.
    void open(callback cb);

    // Watch dir for created / written / moved-in entries. Returns the
    // inotify_add_watch error, if any: no_such_file_or_directory while dir
    // does not exist yet, not_a_directory for a file, no_space_on_device
    // when the per-user watch limit is exhausted.
    std::error_code add_watch(const std::string& dir);

    // Stop watching dir. No-op if it is not watched.
    void remove_watch(const std::string& dir);

    bool is_watching(const std::string& dir) const;

    // Read loop; co_spawn on the io_context. Ends when close() is called.
    asio::awaitable<void> run();

    // Must run on the io_context thread (or while it is not running).
    void close();

private:
    void dispatch_events(const char* data, std::size_t size);

    asio::posix::stream_descriptor m_descriptor;
    std::shared_ptr<spdlog::logger> m_log;
    callback m_callback;

    mutable std::mutex m_mutex;
    std::unordered_map<int, std::string> m_watches;  // wd -> directory
};

} // namespace session_tail
