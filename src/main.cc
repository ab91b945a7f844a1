
#include <csignal>
#include <atomic>
#include <thread>
#include <chrono>
#include <memory>

#include "spdlog/spdlog.h"
#include "gflags/gflags.h"

#include "dirmirror/config.h"
#include "dirmirror/event_channel.h"
#include "dirmirror/fs_watcher.h"
#include "dirmirror/watch_loop.h"

DEFINE_string(config, "", "Path to YAML configuration file");

namespace {
    std::atomic<bool> g_running{true};
}

void signal_handler(int signum) {
    if (signum == SIGINT || signum == SIGTERM) {
        g_running.store(false, std::memory_order_release);
    }
}

void setup_signal_handlers() {
    std::signal(SIGINT, signal_handler);
    std::signal(SIGTERM, signal_handler);
    std::signal(SIGPIPE, SIG_IGN);
}

void setup_logging(const std::string& level, const std::string& pattern) {
    spdlog::set_pattern(pattern);

    // from_str() maps anything it does not know to "off"
    auto parsed = spdlog::level::from_str(level);
    if (parsed == spdlog::level::off && level != "off") {
        spdlog::warn("Unknown log level '{}', using 'info'", level);
        parsed = spdlog::level::info;
    }
    spdlog::set_level(parsed);
}

dirmirror::Result<dirmirror::MirrorConfig> load_configuration(int argc, char* argv[]) {
    auto result = dirmirror::ConfigLoader::load_from_file(FLAGS_config);
    if (!result.ok()) {
        return result;
    }

    dirmirror::MirrorConfig config = result.value();
    dirmirror::ConfigLoader::apply_command_line_flags(config);

    // positional roots win over both the file and the flags
    if (argc == 3) {
        config.watch_root = argv[1];
        config.output_root = argv[2];
    } else if (argc != 1) {
        return dirmirror::Error(dirmirror::ErrorCode::InvalidConfig,
                                "expected <watch_root> <output_root>, got " + std::to_string(argc - 1) + " arguments");
    }

    auto validation = config.validate();
    if (!validation.ok()) {
        return dirmirror::Error(dirmirror::ErrorCode::InvalidConfig,
                                "Configuration validation failed: " + validation.error().to_string());
    }

    return config;
}

int main(int argc, char* argv[]) {
    gflags::SetUsageMessage("Mirror a directory tree into another one\n"
                            "Usage: dirmirror [flags] <watch_root> <output_root>");
    gflags::SetVersionString("0.1.0");
    gflags::ParseCommandLineFlags(&argc, &argv, true);

    dirmirror::MirrorConfig defaults;
    setup_logging(defaults.log_level, defaults.log_pattern);

    auto config_result = load_configuration(argc, argv);
    if (!config_result.ok()) {
        spdlog::error("Configuration error: {}", config_result.error().to_string());
        gflags::ShutDownCommandLineFlags();
        return 1;
    }

    const auto& config = config_result.value();
    setup_logging(config.log_level, config.log_pattern);

    auto roots_result = dirmirror::ConfigLoader::resolve_roots(config);
    if (!roots_result.ok()) {
        spdlog::critical("{}", roots_result.error().to_string());
        gflags::ShutDownCommandLineFlags();
        return 1;
    }
    const dirmirror::MirrorRoots& roots = roots_result.value();

    setup_signal_handlers();

    dirmirror::fs::WatcherOptions watcher_options;
    watcher_options.move_pair_timeout = std::chrono::milliseconds(config.move_pair_timeout_ms);
    watcher_options.report_existing_entries = config.report_existing_entries;

    dirmirror::EventChannel channel;
    auto watcher = std::make_unique<dirmirror::fs::Watcher>(roots.watch_root, channel, watcher_options);

    auto started = watcher->start();
    if (!started.ok()) {
        spdlog::critical("Failed to start filesystem watcher: {}", started.error().to_string());
        gflags::ShutDownCommandLineFlags();
        return 1;
    }

    spdlog::info("Watching {}", roots.watch_root);
    spdlog::info("Outputting to {}", roots.output_root);
    spdlog::info("(Ctrl+C to quit)");

    // the loop blocks on the channel, so shutdown is driven from here
    std::thread shutdown_thread([&watcher]() {
        while (g_running.load(std::memory_order_acquire) && watcher->isRunning()) {
            std::this_thread::sleep_for(std::chrono::milliseconds(100));
        }
        if (!g_running.load(std::memory_order_acquire)) {
            spdlog::info("Received close signal, shutting down...");
        }
        watcher->stop();
    });

    dirmirror::WatchLoop loop(roots, channel);
    loop.run();

    g_running.store(false, std::memory_order_release);
    shutdown_thread.join();
    watcher.reset();

    gflags::ShutDownCommandLineFlags();
    spdlog::info("Shutdown complete");
    return 0;
}
