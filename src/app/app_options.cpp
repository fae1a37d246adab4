#include "app/app_options.h"

#include "core/languages.h"

#include <iostream>

namespace rtsub {
namespace app {

void printHelp(const char* exeName) {
    std::cout << "Usage: " << exeName << " [options]\n\n";
    std::cout << "Options:\n";
    std::cout << "  -c, --config <path>     config file (default: " << DEFAULT_CONFIG_FILE
              << ")\n";
    std::cout << "  -s, --source <src>      audio source: monitor | mic\n";
    std::cout << "  -d, --direction <dir>   translation direction, e.g. en" << languages::DIRECTION_ARROW
              << "zh\n";
    std::cout << "  --worker                run the capture/translation worker (internal)\n";
    std::cout << "  -h, --help              Show this help\n\n";
    std::cout << "Console keys: t=toggle direction, s=switch source, d <dir>=set direction, "
                 "q=quit\n";
    std::cout << std::endl;
}

bool parseArgs(int argc, char** argv, AppOptions& options, bool& showHelp, std::string& error) {
    showHelp = false;
    for (int i = 1; i < argc; ++i) {
        std::string arg(argv[i]);
        if (arg == "-h" || arg == "--help") {
            printHelp(argv[0]);
            showHelp = true;
            return false;
        }
        if ((arg == "-c" || arg == "--config") && i + 1 < argc) {
            options.configPath = argv[++i];
            continue;
        }
        if ((arg == "-s" || arg == "--source") && i + 1 < argc) {
            std::string value = argv[++i];
            if (value != "mic" && value != "microphone" && value != "monitor") {
                error = "Unknown source: " + value;
                return false;
            }
            options.source = value;
            continue;
        }
        if ((arg == "-d" || arg == "--direction") && i + 1 < argc) {
            options.direction = argv[++i];
            continue;
        }
        if (arg == "--worker") {
            options.worker = true;
            continue;
        }
        error = "Unknown or incomplete argument: " + arg;
        return false;
    }
    return true;
}

void applyOverrides(const AppOptions& options, WorkerConfig& config) {
    if (options.source) {
        config.source = parseSourceKind(*options.source);
    }
    if (options.direction) {
        config.direction = languages::formatDirection(languages::parseDirection(*options.direction));
    }
}

}  // namespace app
}  // namespace rtsub
