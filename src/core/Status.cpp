#include "core/Status.hpp"

namespace tether {

const char* errorCodeToString(ErrorCode code) {
    switch (code) {
        case ErrorCode::AlreadyRegistered:     return "AlreadyRegistered";
        case ErrorCode::NotFound:              return "NotFound";
        case ErrorCode::DependencyNotMet:      return "DependencyNotMet";
        case ErrorCode::CircularDependency:    return "CircularDependency";
        case ErrorCode::InvalidState:          return "InvalidState";
        case ErrorCode::InitializationFailed:  return "InitializationFailed";
        case ErrorCode::ActivationFailed:      return "ActivationFailed";
        case ErrorCode::DeactivationFailed:    return "DeactivationFailed";
        case ErrorCode::DisposalFailed:        return "DisposalFailed";
        case ErrorCode::DisposalDepthExceeded: return "DisposalDepthExceeded";
    }
    return "Unknown";
}

std::string Error::message() const {
    std::string msg = errorCodeToString(code);
    msg += " '";
    msg += resourceId;
    msg += "'";

    if (!relatedIds.empty()) {
        msg += " [";
        for (size_t i = 0; i < relatedIds.size(); ++i) {
            if (i > 0) msg += ", ";
            msg += relatedIds[i];
        }
        msg += "]";
    }
    if (!cause.empty()) {
        msg += ": ";
        msg += cause;
    }
    return msg;
}

Status Status::failure(ErrorCode code, std::string resourceId, std::string cause,
                       std::vector<std::string> relatedIds) {
    Error error;
    error.code = code;
    error.resourceId = std::move(resourceId);
    error.cause = std::move(cause);
    error.relatedIds = std::move(relatedIds);
    return Status(std::move(error));
}

} // namespace tether
