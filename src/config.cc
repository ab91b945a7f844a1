
#include "dirmirror/config.h"
#include "spdlog/spdlog.h"
#include "yaml-cpp/yaml.h"
#include "gflags/gflags.h"

DEFINE_string(watch_root, "", "Directory to watch (overrides the config file)");
DEFINE_string(output_root, "", "Directory to mirror into (overrides the config file)");
DEFINE_int32(move_pair_timeout_ms, 0, "Milliseconds a rename half waits for its partner");
DEFINE_string(log_level, "", "Log level (trace, debug, info, warn, error, critical)");
DEFINE_string(log_pattern, "", "spdlog pattern for console output");

namespace dirmirror {

Result<void> MirrorConfig::validate() const {
    if (watch_root.empty()) {
        return Error(ErrorCode::InvalidConfig, "watch_root cannot be empty");
    }
    if (output_root.empty()) {
        return Error(ErrorCode::InvalidConfig, "output_root cannot be empty");
    }
    if (move_pair_timeout_ms <= 0) {
        return Error(ErrorCode::InvalidConfig, "move_pair_timeout_ms must be positive");
    }
    if (log_level.empty()) {
        return Error(ErrorCode::InvalidConfig, "log_level cannot be empty");
    }
    return Result<void>();
}

Result<MirrorConfig> ConfigLoader::load_from_file(const std::string& config_path) {
    if (config_path.empty()) {
        return MirrorConfig(); // Return default config
    }

    return parse_yaml(config_path);
}

Result<MirrorConfig> ConfigLoader::parse_yaml(const std::string& config_path) {
    MirrorConfig config;

    try {
        YAML::Node yaml = YAML::LoadFile(config_path);

        // Parse mirror section
        if (yaml["mirror"]) {
            const auto& mirror = yaml["mirror"];
            if (mirror["watch_root"]) {
                config.watch_root = mirror["watch_root"].as<std::string>();
            }
            if (mirror["output_root"]) {
                config.output_root = mirror["output_root"].as<std::string>();
            }
        }

        // Parse watcher section
        if (yaml["watcher"]) {
            const auto& watcher = yaml["watcher"];
            if (watcher["move_pair_timeout_ms"]) {
                config.move_pair_timeout_ms = watcher["move_pair_timeout_ms"].as<int>();
            }
            if (watcher["report_existing_entries"]) {
                config.report_existing_entries = watcher["report_existing_entries"].as<bool>();
            }
        }

        // Parse logging section
        if (yaml["logging"]) {
            const auto& logging = yaml["logging"];
            if (logging["level"]) {
                config.log_level = logging["level"].as<std::string>();
            }
            if (logging["pattern"]) {
                config.log_pattern = logging["pattern"].as<std::string>();
            }
        }

        spdlog::info("Loaded configuration from {}", config_path);
        return config;

    } catch (const YAML::Exception& e) {
        spdlog::error("Error loading config file {}: {}", config_path, e.what());
        return Error(ErrorCode::InvalidConfig,
                    std::string("Failed to parse config: ") + e.what());
    }
}

void ConfigLoader::apply_command_line_flags(MirrorConfig& config) {
    if (!FLAGS_watch_root.empty()) {
        config.watch_root = FLAGS_watch_root;
        spdlog::debug("Override watch_root: {}", config.watch_root);
    }
    if (!FLAGS_output_root.empty()) {
        config.output_root = FLAGS_output_root;
        spdlog::debug("Override output_root: {}", config.output_root);
    }
    if (FLAGS_move_pair_timeout_ms > 0) {
        config.move_pair_timeout_ms = FLAGS_move_pair_timeout_ms;
        spdlog::debug("Override move_pair_timeout_ms: {}", config.move_pair_timeout_ms);
    }
    if (!FLAGS_log_level.empty()) {
        config.log_level = FLAGS_log_level;
        spdlog::debug("Override log_level: {}", config.log_level);
    }
    if (!FLAGS_log_pattern.empty()) {
        config.log_pattern = FLAGS_log_pattern;
        spdlog::debug("Override log_pattern: {}", config.log_pattern);
    }
}

Result<MirrorRoots> ConfigLoader::resolve_roots(const MirrorConfig& config) {
    auto roots = canonicalize_roots(config.watch_root, config.output_root);
    if (!roots.ok()) {
        return roots;
    }

    const MirrorRoots& resolved = roots.value();
    if (is_under(resolved.watch_root, resolved.output_root)) {
        return Error(ErrorCode::InvalidConfig,
                     "output root " + resolved.output_root + " lies inside watch root " + resolved.watch_root);
    }
    if (is_under(resolved.output_root, resolved.watch_root)) {
        return Error(ErrorCode::InvalidConfig,
                     "watch root " + resolved.watch_root + " lies inside output root " + resolved.output_root);
    }
    return roots;
}

}
