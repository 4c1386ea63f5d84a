#pragma once

#include <cstdint>
#include <optional>
#include <string>
#include <vector>

namespace lanbeam::cli {

struct CliOptions {
    std::optional<uint16_t> port;
    std::optional<std::string> alias;
    std::optional<std::string> config_path;
    std::optional<std::string> log_level;
    std::optional<std::string> save_dir;
    std::optional<std::string> target_alias;
    std::optional<int> wait_seconds;
    bool http = false;
    bool quick_save = false;
    bool text = false;
    bool checksum = false;
    std::optional<std::string> command;
    std::vector<std::string> command_args;
};

class ArgumentParser {
public:
    ArgumentParser(int argc, char* argv[]);

    // Throws std::invalid_argument on unknown options, missing values and
    // values out of range.
    CliOptions Parse();

    static void ShowHelp();

private:
    int argc_;
    char** argv_;
    int i; // index of the argument being parsed

    void parseOption(const std::string& arg, CliOptions& options);
    std::string nextValue(const std::string& option);

    static void validateOptions(const CliOptions& options);
};

} // namespace lanbeam::cli
