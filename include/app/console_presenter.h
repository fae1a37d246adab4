#pragma once

#include "ipc/pipeline_host.h"
#include "ipc/protocol.h"

#include <optional>
#include <ostream>
#include <string>
#include <unistd.h>

namespace rtsub {
namespace app {

// Map one console line to a worker command ("t", "s", "d en→ja", "q")
std::optional<std::string> mapConsoleInput(const std::string& line);

// Single display line (or two for a translated update) for an event
std::string formatEvent(const ipc::OutboundEvent& event);

/**
 * @brief Terminal front end for the worker
 *
 * Prints worker events and forwards console keys as commands until "q",
 * a shutdown signal, or the worker exits on its own.
 */
class ConsolePresenter {
   public:
    ConsolePresenter(ipc::WorkerConnection& host, std::ostream& out, int inputFd = STDIN_FILENO);

    // Returns the process exit code
    int run();

   private:
    // Reads whatever is available on stdin without blocking
    void pumpInput();
    void handleLine(const std::string& line);

    ipc::WorkerConnection& host_;
    std::ostream& out_;
    int inputFd_;
    std::string inputBuffer_;
    bool inputOpen_ = true;
    bool quit_ = false;
};

}  // namespace app
}  // namespace rtsub
