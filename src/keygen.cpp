
#include <string>
#include "spdlog/spdlog.h"
#include "spdlog/sinks/stdout_color_sinks.h"
#include "CLI/CLI.hpp"

#include "dirmirror/identity.h"

int main(int argc, char **argv) {
    CLI::App app {"Generate dirmirror peer keys", "dirmirror-keygen"};
    app.set_version_flag("-v,--version", []() { return "dirmirror-keygen: Version 0.1.0"; });

    std::string output_dir;
    auto default_dir = dirmirror::identity::default_key_directory();
    if (default_dir.ok()) {
        output_dir = default_dir.value();
    }

    auto* output_option = app.add_option("-O,--output", output_dir, "Directory to write the keypair into")
        ->capture_default_str();
    if (!default_dir.ok()) {
        output_option->required();
    }

    CLI11_PARSE(app, argc, argv);

    auto logger = spdlog::stdout_color_mt("keygen");
    spdlog::set_default_logger(logger);
    spdlog::set_pattern("%v");

    auto checked = dirmirror::identity::check_key_directory(output_dir);
    if (!checked.ok()) {
        spdlog::error("Error: {}", checked.error().to_string());
        return 1;
    }

    spdlog::info("Generating new Ed25519 keypair...");
    auto keypair = dirmirror::identity::generate_keypair();
    if (!keypair.ok()) {
        spdlog::critical("{}", keypair.error().to_string());
        return 1;
    }

    auto peer_id = dirmirror::identity::save_keypair(output_dir, keypair.value());
    if (!peer_id.ok()) {
        spdlog::critical("Failed to save keypair: {}", peer_id.error().to_string());
        return 1;
    }
    spdlog::info("Peer ID: {}", peer_id.value());

    // read it back before telling anyone it worked
    auto loaded = dirmirror::identity::load_keypair(output_dir, peer_id.value());
    if (!loaded.ok()) {
        spdlog::critical("Failed to reload keypair: {}", loaded.error().to_string());
        return 1;
    }
    if (loaded.value().public_key != keypair.value().public_key) {
        spdlog::critical("Reloaded keypair does not match the generated one");
        return 1;
    }

    spdlog::info("Keys written to {}", output_dir);
    return 0;
}
