#ifndef DIRMIRROR_CONFIG_H
#define DIRMIRROR_CONFIG_H

#include <cstdint>
#include <string>
#include "dirmirror/path_remapper.h"
#include "dirmirror/result.h"

namespace dirmirror {

struct MirrorConfig {
    // Mirror roots
    std::string watch_root;
    std::string output_root;

    // Watcher
    int move_pair_timeout_ms = 500;
    bool report_existing_entries = true;

    // Logging
    std::string log_level = "info";
    std::string log_pattern = "[%Y-%m-%d %H:%M:%S.%e] [%^%l%$] %v";

    // Validation
    Result<void> validate() const;
};

class ConfigLoader {
public:
    static Result<MirrorConfig> load_from_file(const std::string& config_path);
    static void apply_command_line_flags(MirrorConfig& config);

    /**
     * Canonicalize both roots and make sure neither contains the other,
     * otherwise mirroring would feed its own writes back into the watch.
     */
    static Result<MirrorRoots> resolve_roots(const MirrorConfig& config);

private:
    static Result<MirrorConfig> parse_yaml(const std::string& config_path);
};

}

#endif
