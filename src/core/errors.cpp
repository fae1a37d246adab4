#include "core/errors.h"

namespace rtsub {

const char* remoteErrorKindToString(RemoteServiceError::Kind kind) {
    switch (kind) {
    case RemoteServiceError::Kind::Timeout:
        return "timeout";
    case RemoteServiceError::Kind::HttpStatus:
        return "http_status";
    case RemoteServiceError::Kind::Transport:
        return "transport";
    case RemoteServiceError::Kind::Protocol:
    default:
        return "protocol";
    }
}

}  // namespace rtsub
