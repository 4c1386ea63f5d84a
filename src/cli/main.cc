#include <cli/argument_parser.h>
#include <cli/cli_manager.h>
#include <core/constant/path.h>
#include <core/util/config.h>
#include <core/util/logger.h>
#include <iostream>
#include <spdlog/spdlog.h>

using namespace lanbeam;
using namespace lanbeam::core;

int main(int argc, char* argv[]) {
    cli::CliOptions options;
    try {
        cli::ArgumentParser parser(argc, argv);
        options = parser.Parse();
    } catch (const std::exception& e) {
        std::cerr << "Error: " << e.what() << "\n\n";
        cli::ArgumentParser::ShowHelp();
        return 2;
    }

    Logger logger(
#ifdef LANBEAM_DEBUG
        Logger::Level::debug,
#else
        Logger::Level::info,
#endif
        path::kLogDir);
    if (options.log_level) {
        logger.set_log_level(spdlog::level::from_str(*options.log_level));
    }

    if (options.config_path) {
        LoadConfig(*options.config_path);
    } else {
        LoadConfig();
    }

    // command line wins over the config file
    if (options.port) {
        settings.port = *options.port;
    }
    if (options.alias) {
        settings.alias = *options.alias;
    }
    if (options.http) {
        settings.https = false;
    }
    if (options.save_dir) {
        settings.save_dir = *options.save_dir;
    }
    if (options.quick_save) {
        settings.quick_save = true;
    }

    try {
        cli::CliManager cli_manager(settings);
        return cli_manager.Run(options);
    } catch (const std::exception& e) {
        spdlog::error("Fatal: {}", e.what());
        return 1;
    }
}
