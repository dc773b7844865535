#include "dir_watcher.hpp"
#include <asio/buffer.hpp>
#include <asio/error.hpp>
#include <asio/use_awaitable.hpp>
#include <sys/inotify.h>
#include <unistd.h>
#include <array>
#include <cerrno>
#include <cstring>
#include <system_error>

namespace session_tail {

namespace {

constexpr uint32_t kWatchMask =
    IN_CREATE | IN_MODIFY | IN_CLOSE_WRITE | IN_MOVED_TO | IN_ONLYDIR;

} // anonymous namespace

dir_watcher::dir_watcher(asio::io_context& ioc, std::shared_ptr<spdlog::logger> log)
    : m_descriptor(ioc), m_log(std::move(log))
{}

dir_watcher::~dir_watcher() {
    close();
}

void dir_watcher::open(callback cb) {
    int fd = ::inotify_init1(IN_NONBLOCK | IN_CLOEXEC);
    if (fd < 0) {
        throw std::system_error(errno, std::generic_category(), "inotify_init1");
    }
    m_descriptor.assign(fd);
    m_callback = std::move(cb);
}

std::error_code dir_watcher::add_watch(const std::string& dir) {
    if (!m_descriptor.is_open()) return std::make_error_code(std::errc::bad_file_descriptor);

    int wd = ::inotify_add_watch(m_descriptor.native_handle(), dir.c_str(), kWatchMask);
    if (wd < 0) {
        std::error_code ec(errno, std::generic_category());
        m_log->debug("dir_watcher: cannot watch '{}': {}", dir, ec.message());
        return ec;
    }

    std::lock_guard<std::mutex> lock(m_mutex);
    m_watches[wd] = dir;
    m_log->debug("dir_watcher: watching '{}' (wd={})", dir, wd);
    return {};
}

void dir_watcher::remove_watch(const std::string& dir) {
    std::lock_guard<std::mutex> lock(m_mutex);
    for (auto it = m_watches.begin(); it != m_watches.end(); ++it) {
        if (it->second != dir) continue;
        if (m_descriptor.is_open()) ::inotify_rm_watch(m_descriptor.native_handle(), it->first);
        m_log->debug("dir_watcher: no longer watching '{}'", dir);
        m_watches.erase(it);
        return;
    }
}

bool dir_watcher::is_watching(const std::string& dir) const {
    std::lock_guard<std::mutex> lock(m_mutex);
    for (const auto& [wd, path] : m_watches) {
        if (path == dir) return true;
    }
    return false;
}

asio::awaitable<void> dir_watcher::run() {
    auto self = shared_from_this();
    alignas(struct inotify_event) std::array<char, 16 * 1024> buf;

    while (m_descriptor.is_open()) {
        std::size_t n = 0;
        try {
            n = co_await m_descriptor.async_read_some(asio::buffer(buf), asio::use_awaitable);
        } catch (const std::system_error& e) {
            if (e.code() != asio::error::operation_aborted &&
                e.code() != asio::error::bad_descriptor) {
                m_log->warn("dir_watcher: read failed: {}", e.what());
            }
            break;
        }
        dispatch_events(buf.data(), n);
    }
    m_log->debug("dir_watcher: stopped");
}

void dir_watcher::dispatch_events(const char* data, std::size_t size) {
    std::size_t offset = 0;
    while (offset + sizeof(struct inotify_event) <= size) {
        struct inotify_event ev;
        std::memcpy(&ev, data + offset, sizeof(ev));

        const char* name_ptr = data + offset + sizeof(struct inotify_event);
        offset += sizeof(struct inotify_event) + ev.len;
        if (offset > size) break;

        std::string name;
        if (ev.len > 0) name.assign(name_ptr, ::strnlen(name_ptr, ev.len));

        if (ev.mask & IN_Q_OVERFLOW) {
            m_log->debug("dir_watcher: event queue overflow");
            if (m_callback) m_callback({}, {}, false);
            continue;
        }

        std::string dir;
        {
            std::lock_guard<std::mutex> lock(m_mutex);
            auto it = m_watches.find(ev.wd);
            if (it == m_watches.end()) continue;
            if (ev.mask & IN_IGNORED) {
                // Directory removed or unmounted; polling takes over
                m_watches.erase(it);
                continue;
            }
            dir = it->second;
        }

        if (m_callback && !name.empty()) {
            m_callback(dir, name, (ev.mask & IN_ISDIR) != 0);
        }
    }
}

void dir_watcher::close() {
    if (!m_descriptor.is_open()) return;

    std::error_code ec;
    m_descriptor.close(ec);
    if (ec) m_log->debug("dir_watcher: close failed: {}", ec.message());

    std::lock_guard<std::mutex> lock(m_mutex);
    m_watches.clear();
}

} // namespace session_tail
