#include "app/console_presenter.h"

#include "core/signal_state.h"
#include "logging/logger.h"

#include <cerrno>
#include <poll.h>
#include <type_traits>
#include <unistd.h>

namespace rtsub {
namespace app {

namespace {

std::string trim(const std::string& s) {
    const char* ws = " \t\r\n";
    auto begin = s.find_first_not_of(ws);
    if (begin == std::string::npos) {
        return "";
    }
    auto end = s.find_last_not_of(ws);
    return s.substr(begin, end - begin + 1);
}

}  // namespace

std::optional<std::string> mapConsoleInput(const std::string& line) {
    std::string input = trim(line);
    if (input == "t") {
        return std::string("toggle");
    }
    if (input == "s") {
        return std::string("switch_source");
    }
    if (input == "q") {
        return std::string("stop");
    }
    if (input.size() > 2 && input[0] == 'd' && (input[1] == ' ' || input[1] == '\t')) {
        return ipc::makeSetDirectionCommand(trim(input.substr(2)));
    }
    return std::nullopt;
}

std::string formatEvent(const ipc::OutboundEvent& event) {
    return std::visit(
        [](const auto& e) -> std::string {
            using T = std::decay_t<decltype(e)>;
            if constexpr (std::is_same_v<T, ipc::TextUpdate>) {
                if (e.translated.empty()) {
                    return "> " + e.original;
                }
                if (e.original.empty()) {
                    return "= " + e.translated;
                }
                return "> " + e.original + "\n= " + e.translated;
            } else if constexpr (std::is_same_v<T, ipc::DirectionChanged>) {
                return "[direction] " + e.direction;
            } else if constexpr (std::is_same_v<T, ipc::SourceChanged>) {
                return "[source] " + e.source;
            } else {
                return "[health] " + e.status + (e.detail.empty() ? "" : ": " + e.detail);
            }
        },
        event);
}

ConsolePresenter::ConsolePresenter(ipc::WorkerConnection& host, std::ostream& out, int inputFd)
    : host_(host), out_(out), inputFd_(inputFd) {}

void ConsolePresenter::pumpInput() {
    while (inputOpen_ && !quit_) {
        pollfd pfd{inputFd_, POLLIN, 0};
        int ready = ::poll(&pfd, 1, 0);
        if (ready <= 0 || !(pfd.revents & (POLLIN | POLLHUP))) {
            return;
        }
        char buffer[256];
        ssize_t n = ::read(inputFd_, buffer, sizeof(buffer));
        if (n < 0 && errno == EINTR) {
            continue;
        }
        if (n <= 0) {
            LOG_DEBUG("[Presenter] stdin closed");
            inputOpen_ = false;
            return;
        }
        inputBuffer_.append(buffer, static_cast<std::size_t>(n));
        std::size_t newline;
        while ((newline = inputBuffer_.find('\n')) != std::string::npos) {
            std::string line = inputBuffer_.substr(0, newline);
            inputBuffer_.erase(0, newline + 1);
            handleLine(line);
        }
    }
}

void ConsolePresenter::handleLine(const std::string& line) {
    auto command = mapConsoleInput(line);
    if (!command) {
        if (!trim(line).empty()) {
            out_ << "? t=toggle s=switch source d <src>→<tgt> q=quit" << std::endl;
        }
        return;
    }
    if (*command == "stop") {
        quit_ = true;
        return;
    }
    if (!host_.sendCommand(*command)) {
        LOG_WARN("[Presenter] Command '{}' not delivered", *command);
    }
}

int ConsolePresenter::run() {
    bool workerExited = false;
    while (!quit_ && !processSignalState().shutdown) {
        auto event = host_.nextEvent(std::chrono::milliseconds(100));
        if (event) {
            out_ << formatEvent(*event) << std::endl;
        }
        // Read keys on every pass, event or not
        pumpInput();
        if (!event && !host_.isWorkerRunning()) {
            workerExited = true;
            break;
        }
    }

    if (workerExited) {
        // Show whatever the worker managed to send before it died
        while (auto event = host_.nextEvent(std::chrono::milliseconds(0))) {
            out_ << formatEvent(*event) << std::endl;
        }
    }

    int exitCode = host_.stop();
    if (workerExited) {
        LOG_ERROR("[Presenter] Worker exited unexpectedly (code {})", exitCode);
        return 1;
    }
    return exitCode == 0 ? 0 : 1;
}

}  // namespace app
}  // namespace rtsub
