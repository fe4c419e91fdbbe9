#include "core/CommandLine.h"

CommandLineOptions parseCommandLine(int argc, const char* const argv[]) {
    CommandLineOptions opts;
    for (int i = 1; i < argc; ++i) {
        std::string arg = argv[i];
        if (arg == "--server-path" || arg == "--config") {
            if (i + 1 >= argc) {
                throw CommandLineError("Missing value for " + arg);
            }
            (arg == "--server-path" ? opts.serverPath : opts.configPath) = argv[++i];
        } else if (arg == "--auto-start") {
            opts.autoStart = true;
        } else if (arg == "--debug") {
            opts.debug = true;
        } else if (arg == "--help" || arg == "-h") {
            opts.showHelp = true;
        } else {
            throw CommandLineError("Unknown argument: " + arg);
        }
    }
    return opts;
}

std::string usageText() {
    return "Usage: bedrock-bridge --server-path <dir|executable> [--auto-start] [--config <file>] [--debug]\n"
           "\n"
           "  --server-path  Bedrock server directory, or the server executable itself\n"
           "  --auto-start   start the server before serving MCP requests\n"
           "  --config       JSON configuration file\n"
           "  --debug        enable debug logging\n"
           "\n"
           "Starting the server is supported on Linux and other POSIX systems only;\n"
           "on Windows the bridge runs but start-server reports a spawn failure.\n";
}
