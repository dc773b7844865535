#include "config.hpp"
#include "session_aggregator.hpp"
#include "session_monitor.hpp"
#include <asio/co_spawn.hpp>
#include <asio/detached.hpp>
#include <asio/io_context.hpp>
#include <asio/signal_set.hpp>
#include <asio/steady_timer.hpp>
#include <asio/this_coro.hpp>
#include <asio/use_awaitable.hpp>
#include <cxxopts.hpp>
#include <spdlog/spdlog.h>
#include <spdlog/sinks/stdout_color_sinks.h>
#include <chrono>
#include <iostream>
#include <memory>

int main(int argc, char* argv[]) {
    cxxopts::Options options("session_tail",
        "Tails agent session JSONL logs and correlates tool calls");

    options.add_options()
        ("c,config", "Path to YAML config file", cxxopts::value<std::string>())
        ("w,workdir", "Working directory of the agent session (overrides config)", cxxopts::value<std::string>())
        ("s,session", "Session id to follow (overrides config)", cxxopts::value<std::string>())
        ("r,root", "Log root directory (overrides config)", cxxopts::value<std::string>())
        ("e,existing", "Also read content written before startup")
        ("v,verbose", "Enable debug logging")
        ("h,help", "Print help");

    auto result = options.parse(argc, argv);

    if (result.count("help")) {
        std::cout << options.help() << std::endl;
        return 0;
    }

    // Logger
    auto console = spdlog::stdout_color_mt("session_tail");

    // Load config
    session_tail::config cfg;
    if (result.count("config")) {
        try {
            cfg = session_tail::load_config(result["config"].as<std::string>());
        } catch (const std::exception& e) {
            console->error("Failed to load config: {}", e.what());
            return 1;
        }
    }

    // CLI overrides
    if (result.count("workdir"))  cfg.working_directory = result["workdir"].as<std::string>();
    if (result.count("session"))  cfg.session_id = result["session"].as<std::string>();
    if (result.count("root"))     cfg.log_root = result["root"].as<std::string>();
    if (result.count("existing")) cfg.include_existing_content = true;
    if (result.count("verbose"))  cfg.log_level = "debug";

    try {
        session_tail::validate_config(cfg);
    } catch (const std::exception& e) {
        console->error("Invalid configuration: {}", e.what());
        std::cout << options.help() << std::endl;
        return 1;
    }

    // Set log level
    if (cfg.log_level == "trace")      spdlog::set_level(spdlog::level::trace);
    else if (cfg.log_level == "debug") spdlog::set_level(spdlog::level::debug);
    else if (cfg.log_level == "warn")  spdlog::set_level(spdlog::level::warn);
    else if (cfg.log_level == "error") spdlog::set_level(spdlog::level::err);
    else                               spdlog::set_level(spdlog::level::info);

    console->info("session_tail starting");
    console->info("  log root: {}", session_tail::resolve_log_root(cfg));
    if (!cfg.session_id.empty()) {
        console->info("  session: {}", cfg.session_id);
    } else {
        console->info("  project: {}", session_tail::derive_project_directory(cfg).value_or("<none>"));
    }
    console->info("  existing content: {}", cfg.include_existing_content ? "yes" : "no");
    console->info("  read threads: {}", cfg.read_threads);

    // Single-threaded io_context (poll loop + inotify)
    asio::io_context ioc(1);

    session_tail::session_monitor monitor(ioc, cfg, console);
    session_tail::session_aggregator aggregator;

    auto sub = monitor.subscribe([&](const session_tail::record& rec) {
        aggregator.apply(rec);
        const auto& h = session_tail::header_of(rec);
        console->debug("{} {} {}{}", h.timestamp_text, session_tail::to_string(h.type), h.uuid,
                       h.is_sub_agent ? " (sub-agent)" : "");
    });

    monitor.on_error([&](const session_tail::monitor_error& err) {
        console->warn("{} error on '{}': {}", session_tail::to_string(err.kind), err.path, err.message);
    });

    asio::steady_timer stats_timer(ioc);

    // Graceful shutdown
    asio::signal_set signals(ioc, SIGINT, SIGTERM);
    signals.async_wait([&](auto, auto) {
        console->info("Shutting down...");
        monitor.stop();
        stats_timer.cancel();
    });

    monitor.start();

    // Periodic stats
    asio::co_spawn(ioc,
        [&]() -> asio::awaitable<void> {
            while (monitor.state() != session_tail::monitor_state::stopped) {
                stats_timer.expires_after(std::chrono::seconds(cfg.stats_interval_seconds));
                try {
                    co_await stats_timer.async_wait(asio::use_awaitable);
                } catch (const std::system_error&) {
                    co_return;  // cancelled on shutdown
                }

                auto ms = monitor.get_stats();
                auto ss = aggregator.snapshot();
                console->info("stats: session={} files={} lines={} records={} duplicates={} parse_failures={} queue_depth={}",
                              monitor.session_id().value_or("-"), ms.tracked_files, ms.lines,
                              ms.records, ms.duplicates, ms.parse_failures, ms.reads.queue_depth);
                console->info("stats: tool_calls={} completed={} pending={} errors={} tokens_in={} tokens_out={} cache_hit={:.2f} agents={}",
                              ss.tool_calls, ss.completed_tool_calls(), ss.pending_tool_calls(),
                              ss.tool_errors, ss.tokens.input_tokens, ss.tokens.output_tokens,
                              ss.average_cache_hit_rate(), ss.agents.size());
            }
        },
        asio::detached
    );

    // Runs until the signal handler stops the monitor and the remaining
    // coroutines wind down
    ioc.run();

    sub.unsubscribe();
    console->info("session_tail stopped");
    return 0;
}
