#pragma once

#include <optional>
#include <string>
#include <vector>

namespace tether {

/// Failure taxonomy shared by every registry operation.
enum class ErrorCode {
    AlreadyRegistered,
    NotFound,
    DependencyNotMet,
    CircularDependency,
    InvalidState,
    InitializationFailed,
    ActivationFailed,
    DeactivationFailed,
    DisposalFailed,
    DisposalDepthExceeded
};

const char* errorCodeToString(ErrorCode code);

/// A typed failure: which operation class failed, for which resource, the
/// ids involved (missing dependencies, unresolved disposals) and the cause
/// reported by a failing hook.
struct Error {
    ErrorCode code = ErrorCode::InvalidState;
    std::string resourceId;
    std::vector<std::string> relatedIds;
    std::string cause;

    /// Human-readable one-line description, used for logging.
    std::string message() const;
};

/// Result of a registry operation: either ok or a single typed Error.
/// Registry failures are values, never exceptions.
class Status {
public:
    Status() = default;
    Status(Error error) : m_error(std::move(error)) {}

    static Status success() { return Status(); }
    static Status failure(ErrorCode code, std::string resourceId,
                          std::string cause = "",
                          std::vector<std::string> relatedIds = {});

    bool ok() const { return !m_error.has_value(); }
    explicit operator bool() const { return ok(); }

    /// The error code. Only meaningful when !ok().
    ErrorCode code() const { return m_error ? m_error->code : ErrorCode::InvalidState; }

    /// Access the error. Only meaningful when !ok().
    const Error& error() const { return *m_error; }

    /// "ok" or the error message.
    std::string message() const { return m_error ? m_error->message() : "ok"; }

    bool is(ErrorCode code) const { return m_error && m_error->code == code; }

private:
    std::optional<Error> m_error;
};

} // namespace tether
