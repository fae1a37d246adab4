#include "app/app_options.h"
#include "app/console_presenter.h"
#include "core/config_loader.h"
#include "core/signal_state.h"
#include "core/subtitle_constants.h"
#include "ipc/pipeline_host.h"
#include "logging/logger.h"
#include "worker/pipeline_worker.h"

#include <filesystem>
#include <iostream>
#include <system_error>
#include <vector>

using namespace rtsub;

namespace {

std::string selfExecutablePath(const char* argv0) {
    std::error_code ec;
    auto path = std::filesystem::read_symlink("/proc/self/exe", ec);
    if (!ec) {
        return path.string();
    }
    return std::filesystem::absolute(argv0, ec).string();
}

std::vector<std::string> forwardedOverrides(const app::AppOptions& options) {
    std::vector<std::string> args;
    if (options.source) {
        args.push_back("--source");
        args.push_back(*options.source);
    }
    if (options.direction) {
        args.push_back("--direction");
        args.push_back(*options.direction);
    }
    return args;
}

int runPresenter(const app::AppOptions& options, const WorkerConfig& config, const char* argv0) {
    ipc::HostOptions hostOptions;
    hostOptions.executable = selfExecutablePath(argv0);
    hostOptions.configPath = options.configPath;
    hostOptions.extraArgs = forwardedOverrides(options);
    hostOptions.eventsEndpoint = config.ipc.eventsEndpoint;
    hostOptions.commandsEndpoint = config.ipc.commandsEndpoint;
    hostOptions.stopTimeoutMs = SubtitleConstants::WORKER_STOP_TIMEOUT_MS;

    try {
        ipc::PipelineHost host(hostOptions);
        if (!host.start()) {
            return 1;
        }
        std::cout << "Listening on " << sourceKindToString(config.source) << " (" << config.direction
                  << "). t=toggle s=switch source d <dir>=direction q=quit" << std::endl;
        app::ConsolePresenter presenter(host, std::cout);
        return presenter.run();
    } catch (const std::exception& e) {
        LOG_CRITICAL("[Presenter] {}", e.what());
        return 1;
    }
}

}  // namespace

int main(int argc, char* argv[]) {
    app::AppOptions options;
    bool showHelp = false;
    std::string error;
    if (!app::parseArgs(argc, argv, options, showHelp, error)) {
        if (showHelp) {
            return 0;
        }
        std::cerr << "Error: " << error << std::endl;
        app::printHelp(argv[0]);
        return 1;
    }

    const std::string role = options.worker ? "worker" : "main";
    logging::initializeEarly(role);
    logging::initializeFromConfig(options.configPath, role);

    WorkerConfig config;
    loadWorkerConfig(options.configPath, config, !options.worker);
    app::applyOverrides(options, config);

    int exitCode = 0;
    if (options.worker) {
        LOG_INFO("[Worker] Starting (source={}, direction={}, asr={})",
                 sourceKindToString(config.source), config.direction, config.asrServer);
        exitCode = worker::runWorkerProcess(config);
    } else {
        installShutdownSignalHandlers();
        exitCode = runPresenter(options, config, argv[0]);
    }

    logging::shutdown();
    return exitCode;
}
