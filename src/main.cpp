#include "clone_worker.hpp"
#include "config.hpp"
#include "errors.hpp"
#include "fs_utils.hpp"
#include "navigator.hpp"
#include "persistent_lists.hpp"
#include "platform_factory.hpp"
#include "project_index.hpp"
#include "status_cache.hpp"
#include "tui/tui_app.hpp"
#include <filesystem>
#include <iostream>
#include <memory>
#include <spdlog/spdlog.h>
#include <spdlog/sinks/basic_file_sink.h>

namespace fs = std::filesystem;

// The TUI owns the terminal, so log records go to a file
static void setup_logging(const fs::path& config_dir) {
    try {
        std::error_code ec;
        fs::create_directories(config_dir, ec);
        auto logger = spdlog::basic_logger_mt("pnav", (config_dir / "pnav.log").string());
        logger->flush_on(spdlog::level::warn);
        spdlog::set_default_logger(logger);
        spdlog::set_level(spdlog::level::info);
    } catch (const spdlog::spdlog_ex& e) {
        spdlog::set_level(spdlog::level::warn);
        spdlog::warn("File logging unavailable: {}", e.what());
    }
}

int main([[maybe_unused]] int argc, [[maybe_unused]] char* argv[]) {
    const fs::path config_dir = pnav::default_config_dir();
    const fs::path config_file = config_dir / "config.yaml";
    setup_logging(config_dir);

    pnav::Config config;
    pnav::ProjectIndex index;
    try {
        config = pnav::load_config(config_file);
        pnav::validate_config(config);
        index.rescan(config.base_dir);
    } catch (const pnav::ConfigError& e) {
        spdlog::error("Configuration error: {}", e.what());
        std::cerr << "Error: " << e.what() << " (" << config_file.string() << ")" << std::endl;
        return 1;
    } catch (const pnav::ScanError& e) {
        spdlog::error("Scan failed: {}", e.what());
        std::cerr << "Error: " << e.what() << std::endl;
        return 1;
    }

    try {
        pnav::PersistentLists lists(config_dir);
        lists.load();

        // Create platform-specific collaborators (owned here in main)
        auto git_client = pnav::make_git_client();
        auto launcher = pnav::make_process_launcher(config);

        pnav::StatusCache status_cache(git_client.get());
        pnav::CloneWorker clone_worker(git_client.get());

        // Navigator and TuiApp do not own these resources - they're managed here
        pnav::Navigator navigator(config, &index, &lists, &status_cache, launcher.get(), &clone_worker);
        navigator.set_on_config_changed([&config_file](const pnav::Config& changed) {
            if (!pnav::save_config(changed, config_file)) {
                spdlog::warn("Theme change applies to this session only");
            }
        });

        pnav::TuiApp app(&navigator, &status_cache);
        app.run();

        // The terminal is back to normal here; a running clone is joined
        // before exit and can take minutes
        if (clone_worker.is_busy()) {
            std::cerr << "Waiting for clone to finish..." << std::endl;
            clone_worker.wait();
        }

        spdlog::info("Exiting");
        return 0;
    } catch (const std::exception& e) {
        // Make sure we restore terminal state before printing error
        endwin();
        spdlog::error("Fatal: {}", e.what());
        std::cerr << "Error: " << e.what() << std::endl;
        return 1;
    }
}
