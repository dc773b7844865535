#include "session_monitor.hpp"
#include "test_helpers.hpp"
#include <asio/executor_work_guard.hpp>
#include <gtest/gtest.h>
#include <filesystem>
#include <mutex>
#include <thread>

using namespace session_tail;
using test_support::append_file;
using test_support::make_log;
using test_support::temp_dir;
using test_support::user_line;
using test_support::write_file;

namespace {

// Collects everything a monitor emits.
struct collector {
    std::mutex mutex;
    std::vector<std::string> uuids;
    std::vector<record_header> headers;
    std::vector<monitor_error> errors;

    void attach(session_monitor& monitor, subscription& sub) {
        sub = monitor.subscribe([this](const record& r) {
            std::lock_guard<std::mutex> lock(mutex);
            uuids.push_back(header_of(r).uuid);
            headers.push_back(header_of(r));
        });
        monitor.on_error([this](const monitor_error& e) {
            std::lock_guard<std::mutex> lock(mutex);
            errors.push_back(e);
        });
    }

    std::size_t count() {
        std::lock_guard<std::mutex> lock(mutex);
        return uuids.size();
    }

    std::size_t errors_of(error_kind kind) {
        std::lock_guard<std::mutex> lock(mutex);
        std::size_t n = 0;
        for (const auto& e : errors) if (e.kind == kind) ++n;
        return n;
    }
};

class session_monitor_test : public ::testing::Test {
protected:
    void SetUp() override {
        cfg.log_root = root.str();
        cfg.working_directory = "/home/dev/app";
        cfg.read_threads = 1;
        cfg.poll_interval_ms = 20;
        project = root.file("-home-dev-app");
    }

    std::string project_file(const std::string& name) const {
        return (std::filesystem::path(project) / name).string();
    }

    temp_dir root;
    config cfg;
    std::string project;
    asio::io_context ioc;
};

} // namespace

TEST_F(session_monitor_test, state_transitions) {
    session_monitor monitor(ioc, cfg, make_log());
    EXPECT_EQ(monitor.state(), monitor_state::stopped);
    EXPECT_EQ(monitor.read_now(), 0u);

    monitor.start();
    EXPECT_EQ(monitor.state(), monitor_state::watching);
    monitor.start();
    EXPECT_EQ(monitor.state(), monitor_state::watching);

    monitor.stop();
    monitor.stop();
    EXPECT_EQ(monitor.state(), monitor_state::stopped);
    EXPECT_STREQ(to_string(monitor.state()), "stopped");
}

TEST_F(session_monitor_test, partial_line_is_emitted_once_completed) {
    std::filesystem::create_directories(project);
    auto path = project_file("sess-1.jsonl");
    auto third = user_line("u3", "three");
    write_file(path, user_line("u1", "one") + "\n" + user_line("u2", "two") + "\n" +
                     third.substr(0, 20));

    session_monitor monitor(ioc, cfg, make_log());
    collector c;
    subscription sub;
    c.attach(monitor, sub);
    monitor.start();

    EXPECT_EQ(monitor.read_now(), 2u);
    EXPECT_EQ(c.uuids, (std::vector<std::string>{"u1", "u2"}));

    append_file(path, third.substr(20) + "\n");
    EXPECT_EQ(monitor.read_now(), 1u);
    EXPECT_EQ(c.uuids.back(), "u3");
    EXPECT_EQ(monitor.session_id().value_or(""), "sess-1");
}

TEST_F(session_monitor_test, sidecar_records_are_flagged_as_sub_agent) {
    std::filesystem::create_directories(project);
    write_file(project_file("sess-1.jsonl"), user_line("p1", "main") + "\n");

    session_monitor monitor(ioc, cfg, make_log());
    collector c;
    subscription sub;
    c.attach(monitor, sub);
    monitor.start();
    ASSERT_EQ(monitor.read_now(), 1u);

    write_file(project_file("agent-7f3.jsonl"), user_line("s1", "side") + "\n");
    ASSERT_EQ(monitor.read_now(), 1u);

    ASSERT_EQ(c.headers.size(), 2u);
    EXPECT_FALSE(c.headers[0].is_sub_agent);
    EXPECT_TRUE(c.headers[1].is_sub_agent);
    EXPECT_EQ(c.headers[1].agent_id.value_or(""), "7f3");
    EXPECT_EQ(monitor.session_id().value_or(""), "sess-1");
    EXPECT_EQ(monitor.tracked_paths().size(), 2u);
}

TEST_F(session_monitor_test, duplicate_records_are_emitted_once) {
    std::filesystem::create_directories(project);
    auto line = user_line("same", "x");
    write_file(project_file("s.jsonl"), line + "\n" + line + "\n");

    session_monitor monitor(ioc, cfg, make_log());
    collector c;
    subscription sub;
    c.attach(monitor, sub);
    monitor.start();

    EXPECT_EQ(monitor.read_now(), 1u);
    EXPECT_EQ(monitor.get_stats().duplicates, 1u);
}

TEST_F(session_monitor_test, malformed_and_unknown_lines_do_not_stall_the_file) {
    std::filesystem::create_directories(project);
    write_file(project_file("s.jsonl"),
               "{\"type\":\"user\",\"uuid\":\n" +
               std::string(R"({"type":"queue-operation","operation":"enqueue"})") + "\n" +
               user_line("ok", "fine") + "\n");

    session_monitor monitor(ioc, cfg, make_log());
    collector c;
    subscription sub;
    c.attach(monitor, sub);
    monitor.start();

    EXPECT_EQ(monitor.read_now(), 1u);
    EXPECT_EQ(c.uuids, (std::vector<std::string>{"ok"}));
    EXPECT_EQ(c.errors_of(error_kind::parse), 1u);

    auto stats = monitor.get_stats();
    EXPECT_EQ(stats.lines, 3u);
    EXPECT_EQ(stats.parse_failures, 1u);
    EXPECT_EQ(stats.unknown_types, 1u);

    // Nothing is retried
    EXPECT_EQ(monitor.read_now(), 0u);
    EXPECT_EQ(c.errors_of(error_kind::parse), 1u);
}

TEST_F(session_monitor_test, truncated_file_is_reread_from_start) {
    std::filesystem::create_directories(project);
    auto path = project_file("s.jsonl");
    write_file(path, user_line("a", "first") + "\n" + user_line("b", "second") + "\n");

    session_monitor monitor(ioc, cfg, make_log());
    collector c;
    subscription sub;
    c.attach(monitor, sub);
    monitor.start();
    ASSERT_EQ(monitor.read_now(), 2u);

    write_file(path, user_line("c", "x") + "\n");
    EXPECT_EQ(monitor.read_now(), 1u);
    EXPECT_EQ(c.uuids.back(), "c");
    EXPECT_EQ(monitor.get_stats().truncations, 1u);
}

TEST_F(session_monitor_test, project_directory_created_after_start) {
    session_monitor monitor(ioc, cfg, make_log());
    collector c;
    subscription sub;
    c.attach(monitor, sub);
    monitor.start();
    EXPECT_EQ(monitor.read_now(), 0u);
    EXPECT_FALSE(monitor.session_id().has_value());

    std::filesystem::create_directories(project);
    write_file(project_file("late.jsonl"), user_line("l1", "hello") + "\n");

    EXPECT_EQ(monitor.read_now(), 1u);
    EXPECT_EQ(monitor.session_id().value_or(""), "late");
}

TEST_F(session_monitor_test, files_older_than_tolerance_are_ignored) {
    std::filesystem::create_directories(project);
    write_file(project_file("old.jsonl"), user_line("o1", "old") + "\n");

    cfg.new_file_tolerance_seconds = 0;
    std::this_thread::sleep_for(std::chrono::milliseconds(1100));

    session_monitor monitor(ioc, cfg, make_log());
    monitor.start();
    EXPECT_EQ(monitor.read_now(), 0u);
    EXPECT_TRUE(monitor.tracked_paths().empty());
}

TEST_F(session_monitor_test, include_existing_reads_old_files) {
    std::filesystem::create_directories(project);
    write_file(project_file("old.jsonl"), user_line("o1", "old") + "\n");

    cfg.new_file_tolerance_seconds = 0;
    cfg.include_existing_content = true;
    std::this_thread::sleep_for(std::chrono::milliseconds(1100));

    session_monitor monitor(ioc, cfg, make_log());
    monitor.start();
    EXPECT_EQ(monitor.read_now(), 1u);
}

TEST_F(session_monitor_test, explicit_session_tails_from_end) {
    std::filesystem::create_directories(project);
    auto path = project_file("abc-123.jsonl");
    write_file(path, user_line("before", "old") + "\n");
    write_file(project_file("other.jsonl"), user_line("other", "x") + "\n");

    cfg.working_directory.clear();
    cfg.session_id = "abc-123";

    session_monitor monitor(ioc, cfg, make_log());
    collector c;
    subscription sub;
    c.attach(monitor, sub);
    monitor.start();

    EXPECT_EQ(monitor.session_id().value_or(""), "abc-123");
    EXPECT_EQ(monitor.read_now(), 0u);

    append_file(path, user_line("after", "new") + "\n");
    EXPECT_EQ(monitor.read_now(), 1u);
    EXPECT_EQ(c.uuids, (std::vector<std::string>{"after"}));
    EXPECT_EQ(monitor.tracked_paths().size(), 1u);
}

TEST_F(session_monitor_test, explicit_session_found_later_is_read_whole) {
    cfg.working_directory.clear();
    cfg.session_id = "later-1";

    session_monitor monitor(ioc, cfg, make_log());
    collector c;
    subscription sub;
    c.attach(monitor, sub);
    monitor.start();
    EXPECT_EQ(monitor.read_now(), 0u);
    EXPECT_FALSE(monitor.session_id().has_value());

    std::filesystem::create_directories(project);
    write_file(project_file("later-1.jsonl"), user_line("x1", "a") + "\n" + user_line("x2", "b") + "\n");

    EXPECT_EQ(monitor.read_now(), 2u);
    EXPECT_EQ(monitor.session_id().value_or(""), "later-1");
}

TEST_F(session_monitor_test, unsubscribed_handler_stops_receiving) {
    std::filesystem::create_directories(project);
    auto path = project_file("s.jsonl");
    write_file(path, user_line("a", "x") + "\n");

    session_monitor monitor(ioc, cfg, make_log());
    collector c;
    subscription sub;
    c.attach(monitor, sub);
    monitor.start();
    ASSERT_EQ(monitor.read_now(), 1u);

    sub.unsubscribe();
    append_file(path, user_line("b", "y") + "\n");
    monitor.read_now();
    EXPECT_EQ(c.count(), 1u);
}

TEST_F(session_monitor_test, restart_does_not_reemit_seen_records) {
    std::filesystem::create_directories(project);
    write_file(project_file("s.jsonl"), user_line("a", "x") + "\n");

    session_monitor monitor(ioc, cfg, make_log());
    collector c;
    subscription sub;
    c.attach(monitor, sub);

    monitor.start();
    ASSERT_EQ(monitor.read_now(), 1u);
    monitor.stop();
    EXPECT_EQ(monitor.read_now(), 0u);

    monitor.start();
    EXPECT_EQ(monitor.read_now(), 0u);
    EXPECT_EQ(c.count(), 1u);
    EXPECT_EQ(monitor.get_stats().duplicates, 1u);
}

TEST_F(session_monitor_test, live_tailing_on_io_context) {
    std::filesystem::create_directories(project);
    auto path = project_file("live.jsonl");
    write_file(path, "");

    session_monitor monitor(ioc, cfg, make_log());
    collector c;
    subscription sub;
    c.attach(monitor, sub);
    monitor.start();

    auto guard = asio::make_work_guard(ioc);
    std::thread runner([this] { ioc.run(); });

    append_file(path, user_line("l1", "one") + "\n");
    EXPECT_TRUE(test_support::wait_for([&] { return c.count() >= 1; }));

    // A line written in two pieces arrives once, whole
    auto line = user_line("l2", "two");
    append_file(path, line.substr(0, 15));
    std::this_thread::sleep_for(std::chrono::milliseconds(60));
    append_file(path, line.substr(15) + "\n");
    EXPECT_TRUE(test_support::wait_for([&] { return c.count() >= 2; }));

    write_file(project_file("agent-zz.jsonl"), user_line("l3", "side") + "\n");
    EXPECT_TRUE(test_support::wait_for([&] { return c.count() >= 3; }));

    monitor.stop();
    guard.reset();
    ioc.stop();
    runner.join();

    std::lock_guard<std::mutex> lock(c.mutex);
    EXPECT_EQ(c.uuids, (std::vector<std::string>{"l1", "l2", "l3"}));
    EXPECT_TRUE(c.headers[2].is_sub_agent);
}

TEST_F(session_monitor_test, stray_file_in_log_root_is_not_tracked) {
    session_monitor monitor(ioc, cfg, make_log());
    collector c;
    subscription sub;
    c.attach(monitor, sub);
    monitor.start();

    auto guard = asio::make_work_guard(ioc);
    std::thread runner([this] { ioc.run(); });

    // Lands in the watched log root while the project directory is absent
    write_file(root.file("x.jsonl"), user_line("stray", "nope") + "\n");
    std::this_thread::sleep_for(std::chrono::milliseconds(300));
    EXPECT_TRUE(monitor.tracked_paths().empty());
    EXPECT_FALSE(monitor.session_id().has_value());

    std::filesystem::create_directories(project);
    write_file(project_file("real.jsonl"), user_line("r1", "yes") + "\n");
    EXPECT_TRUE(test_support::wait_for([&] { return c.count() >= 1; }));

    monitor.stop();
    guard.reset();
    ioc.stop();
    runner.join();

    std::lock_guard<std::mutex> lock(c.mutex);
    EXPECT_EQ(c.uuids, (std::vector<std::string>{"r1"}));
    EXPECT_FALSE(c.headers[0].is_sub_agent);
    EXPECT_EQ(monitor.session_id().value_or(""), "real");
}

TEST_F(session_monitor_test, unwatchable_root_is_reported_once_and_polling_continues) {
    // A regular file where the log root should be: the watch fails with ENOTDIR
    auto logs = root.file("logs");
    write_file(logs, "");
    cfg.log_root = logs;

    session_monitor monitor(ioc, cfg, make_log());
    collector c;
    subscription sub;
    c.attach(monitor, sub);
    monitor.start();

    EXPECT_EQ(c.errors_of(error_kind::engine_fatal), 1u);
    for (int i = 0; i < 3; ++i) {
        EXPECT_EQ(monitor.read_now(), 0u);
    }
    EXPECT_EQ(c.errors_of(error_kind::engine_fatal), 1u);
    EXPECT_EQ(monitor.state(), monitor_state::watching);

    std::filesystem::remove(logs);
    auto project_dir = std::filesystem::path(logs) / "-home-dev-app";
    std::filesystem::create_directories(project_dir);
    write_file((project_dir / "s.jsonl").string(), user_line("p1", "after") + "\n");

    EXPECT_EQ(monitor.read_now(), 1u);
    EXPECT_EQ(c.uuids, (std::vector<std::string>{"p1"}));
    EXPECT_EQ(c.errors_of(error_kind::engine_fatal), 1u);
}

TEST_F(session_monitor_test, unreadable_file_reports_io_error_once) {
    std::filesystem::create_directories(project);
    auto path = project_file("s.jsonl");
    auto first = user_line("a", "first") + "\n";
    write_file(path, first);

    session_monitor monitor(ioc, cfg, make_log());
    collector c;
    subscription sub;
    c.attach(monitor, sub);
    monitor.start();
    ASSERT_EQ(monitor.read_now(), 1u);

    // Same path, now a directory
    std::filesystem::remove(path);
    std::filesystem::create_directory(path);
    for (int i = 0; i < 3; ++i) {
        EXPECT_EQ(monitor.read_now(), 0u);
    }
    EXPECT_EQ(c.errors_of(error_kind::io), 1u);

    // Back to a file: reading resumes at the old offset
    std::filesystem::remove(path);
    auto second = user_line("b", "second") + "\n";
    write_file(path, first + second);
    EXPECT_EQ(monitor.read_now(), 1u);
    EXPECT_EQ(c.uuids, (std::vector<std::string>{"a", "b"}));

    auto s = monitor.get_stats();
    EXPECT_EQ(s.bytes, first.size() + second.size());
    EXPECT_EQ(s.truncations, 0u);

    // Recovery re-arms the report
    std::filesystem::remove(path);
    std::filesystem::create_directory(path);
    monitor.read_now();
    EXPECT_EQ(c.errors_of(error_kind::io), 2u);
}

TEST_F(session_monitor_test, read_now_from_handler_returns_zero) {
    std::filesystem::create_directories(project);
    write_file(project_file("s.jsonl"), user_line("a", "main") + "\n");
    write_file(project_file("agent-1.jsonl"), user_line("b", "side") + "\n");

    session_monitor monitor(ioc, cfg, make_log());
    std::vector<std::size_t> nested;
    auto sub = monitor.subscribe([&](const record&) {
        nested.push_back(monitor.read_now());
    });
    monitor.start();

    EXPECT_EQ(monitor.read_now(), 2u);
    EXPECT_EQ(nested, (std::vector<std::size_t>{0u, 0u}));
    EXPECT_EQ(monitor.get_stats().records, 2u);
}
