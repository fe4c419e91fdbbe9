#pragma once
#include <stdexcept>
#include <string>

struct CommandLineOptions {
    std::string serverPath;
    std::string configPath;
    bool autoStart = false;
    bool debug = false;
    bool showHelp = false;
};

struct CommandLineError : std::invalid_argument {
    using std::invalid_argument::invalid_argument;
};

/**
 * @brief Parse bedrock-bridge arguments (argv[0] is skipped).
 * @throws CommandLineError on an unknown flag or a flag missing its value.
 */
CommandLineOptions parseCommandLine(int argc, const char* const argv[]);

std::string usageText();
