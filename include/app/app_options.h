#pragma once

#include "core/config_loader.h"

#include <optional>
#include <string>

namespace rtsub {
namespace app {

struct AppOptions {
    std::string configPath = DEFAULT_CONFIG_FILE;
    std::optional<std::string> source;     // --source mic|monitor
    std::optional<std::string> direction;  // --direction en→zh
    bool worker = false;                   // run as the pipeline worker process
};

// Parse CLI arguments. showHelp=true means help was printed and nothing else should run.
bool parseArgs(int argc, char** argv, AppOptions& options, bool& showHelp, std::string& error);

void printHelp(const char* exeName);

// Apply --source / --direction on top of the loaded config
void applyOverrides(const AppOptions& options, WorkerConfig& config);

}  // namespace app
}  // namespace rtsub
