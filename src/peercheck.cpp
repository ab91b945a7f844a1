
#include <string>
#include "spdlog/spdlog.h"
#include "spdlog/sinks/stdout_color_sinks.h"
#include "CLI/CLI.hpp"

#include "dirmirror/identity.h"

int main(int argc, char **argv) {
    CLI::App app {"Load a dirmirror peer keypair and confirm its peer id", "dirmirror-peercheck"};
    app.set_version_flag("-v,--version", []() { return "dirmirror-peercheck: Version 0.1.0"; });

    std::string input_dir;
    auto default_dir = dirmirror::identity::default_key_directory();
    if (default_dir.ok()) {
        input_dir = default_dir.value();
    }

    auto* input_option = app.add_option("-I,--input", input_dir, "Directory holding the keypair")
        ->capture_default_str();
    if (!default_dir.ok()) {
        input_option->required();
    }

    std::string peer_id;
    app.add_option("peer_id", peer_id, "Peer ID to load")->required();

    CLI11_PARSE(app, argc, argv);

    auto logger = spdlog::stdout_color_mt("peercheck");
    spdlog::set_default_logger(logger);
    spdlog::set_pattern("%v");

    auto checked = dirmirror::identity::check_key_directory(input_dir);
    if (!checked.ok()) {
        spdlog::error("Error: {}", checked.error().to_string());
        return 1;
    }

    auto loaded = dirmirror::identity::load_keypair(input_dir, peer_id);
    if (!loaded.ok()) {
        spdlog::critical("Failed to load keypair: {}", loaded.error().to_string());
        return 1;
    }

    const std::string derived = dirmirror::identity::derive_peer_id(loaded.value().public_key);
    if (derived != peer_id) {
        spdlog::critical("Peer ID mismatch: expected {}, got {}", peer_id, derived);
        return 1;
    }

    spdlog::info("Keypair loaded successfully for peer: {}", peer_id);
    return 0;
}
