#include <algorithm>
#include <cli/argument_parser.h>
#include <cstdlib>
#include <iostream>
#include <stdexcept>

namespace lanbeam::cli {

ArgumentParser::ArgumentParser(int argc, char* argv[])
    : argc_(argc)
    , argv_(argv)
    , i(1) {}

CliOptions ArgumentParser::Parse() {
    CliOptions options;

    // options may appear before or after the command
    while (i < argc_) {
        std::string arg = argv_[i];

        if (arg == "--") {
            while (++i < argc_) {
                options.command_args.emplace_back(argv_[i]);
            }
            break;
        }
        if (arg.size() > 1 && arg[0] == '-') {
            parseOption(arg, options);
        } else if (!options.command) {
            options.command = arg;
        } else {
            options.command_args.push_back(arg);
        }
        i++;
    }

    validateOptions(options);
    return options;
}

std::string ArgumentParser::nextValue(const std::string& option) {
    if (++i >= argc_) {
        throw std::invalid_argument("Missing value for " + option);
    }
    return argv_[i];
}

void ArgumentParser::parseOption(const std::string& arg, CliOptions& options) {
    if (arg == "-p" || arg == "--port") {
        std::string value = nextValue(arg);
        int port = 0;
        try {
            port = std::stoi(value);
        } catch (const std::exception&) {
            throw std::invalid_argument("Invalid port: " + value);
        }
        if (port < 1 || port > 65535) {
            throw std::invalid_argument("Port must be between 1 and 65535");
        }
        options.port = static_cast<uint16_t>(port);
    } else if (arg == "-a" || arg == "--alias") {
        options.alias = nextValue(arg);
    } else if (arg == "-c" || arg == "--config") {
        options.config_path = nextValue(arg);
    } else if (arg == "-l" || arg == "--log-level") {
        options.log_level = nextValue(arg);
    } else if (arg == "-d" || arg == "--dest") {
        options.save_dir = nextValue(arg);
    } else if (arg == "-t" || arg == "--to") {
        options.target_alias = nextValue(arg);
    } else if (arg == "-w" || arg == "--wait") {
        std::string value = nextValue(arg);
        try {
            options.wait_seconds = std::stoi(value);
        } catch (const std::exception&) {
            throw std::invalid_argument("Invalid wait time: " + value);
        }
    } else if (arg == "--http") {
        options.http = true;
    } else if (arg == "-q" || arg == "--quick-save") {
        options.quick_save = true;
    } else if (arg == "--text") {
        options.text = true;
    } else if (arg == "--checksum") {
        options.checksum = true;
    } else if (arg == "-h" || arg == "--help") {
        ShowHelp();
        std::exit(0);
    } else {
        throw std::invalid_argument("Unknown option: " + arg);
    }
}

void ArgumentParser::validateOptions(const CliOptions& options) {
    if (options.log_level) {
        std::string level = *options.log_level;
        std::transform(level.begin(), level.end(), level.begin(), ::tolower);
        if (level != "trace" && level != "debug" && level != "info" && level != "warning"
            && level != "warn" && level != "error") {
            throw std::invalid_argument("Invalid log level: " + *options.log_level);
        }
    }

    if (options.wait_seconds && *options.wait_seconds < 1) {
        throw std::invalid_argument("Wait time must be at least one second");
    }

    if (!options.command) {
        return;
    }
    const std::string& command = *options.command;
    if (command != "receive" && command != "list" && command != "send" && command != "help") {
        throw std::invalid_argument("Unknown command: " + command);
    }
    if (command == "send" && options.command_args.empty()) {
        throw std::invalid_argument(options.text ? "Nothing to send: give the text to send"
                                                 : "Nothing to send: give files or directories");
    }
}

void ArgumentParser::ShowHelp() {
    std::cout << "Usage: lanbeam [options] <command> [args...]\n\n"
              << "Commands:\n"
              << "  receive              Accept files from peers until interrupted\n"
              << "  list                 List devices announcing on the network\n"
              << "  send PATH...         Send files or directories to a peer\n"
              << "  send --text TEXT...  Send a text message to a peer\n"
              << "  help                 Show this help message\n\n"
              << "Options:\n"
              << "  -p, --port PORT      HTTP port to serve and announce (default: 53317)\n"
              << "  -a, --alias NAME     Name announced to peers (default: hostname)\n"
              << "      --http           Use plain HTTP instead of HTTPS\n"
              << "  -c, --config PATH    Config file path\n"
              << "  -l, --log-level LVL  Log level (trace|debug|info|warning|error)\n"
              << "  -d, --dest DIR       Directory incoming files are saved to\n"
              << "  -q, --quick-save     Accept incoming files without asking\n"
              << "  -t, --to ALIAS       Peer to send to (default: the only peer found)\n"
              << "  -w, --wait SECONDS   How long to look for peers\n"
              << "      --checksum       Attach SHA-256 checksums to sent files\n"
              << "  -h, --help           Show this help message\n";
}

} // namespace lanbeam::cli
