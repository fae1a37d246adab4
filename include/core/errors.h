#pragma once

#include <stdexcept>
#include <string>

namespace rtsub {

// Audio device could not be opened or started
class DeviceError : public std::runtime_error {
   public:
    using std::runtime_error::runtime_error;
};

// Speech probability model failed on a frame
class InferenceError : public std::runtime_error {
   public:
    using std::runtime_error::runtime_error;
};

class ConfigError : public std::runtime_error {
   public:
    using std::runtime_error::runtime_error;
};

/**
 * @brief Failure talking to the ASR or translation service
 *
 * Timeouts carry their own kind so callers can shed backlog without
 * inspecting the message text.
 */
class RemoteServiceError : public std::runtime_error {
   public:
    enum class Kind {
        Timeout,     // request exceeded its deadline
        HttpStatus,  // server answered with a non-2xx status
        Transport,   // connection refused, DNS, TLS ...
        Protocol     // body could not be interpreted
    };

    RemoteServiceError(Kind kind, const std::string& message, long httpStatus = 0)
        : std::runtime_error(message), kind_(kind), httpStatus_(httpStatus) {}

    Kind kind() const {
        return kind_;
    }
    long httpStatus() const {
        return httpStatus_;
    }
    bool isTimeout() const {
        return kind_ == Kind::Timeout;
    }

   private:
    Kind kind_;
    long httpStatus_;
};

const char* remoteErrorKindToString(RemoteServiceError::Kind kind);

}  // namespace rtsub
