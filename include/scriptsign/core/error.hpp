#pragma once

#include <expected>
#include <string>
#include <string_view>

namespace scriptsign {

enum class ErrorCode {
    InvalidConfig = 1,
    IoError,
    Timeout,
    ConnectionFailed,
    SerializationError,
    ServiceRejected,

    // Signing workflow
    ScriptNotFound,
    PfxNotFound,
    ServiceUnreachable,
    RuntimeUnavailable,
    NoCertificatesFound,
    SignRequestFailed,
    VerifyRequestFailed,
};

class Error {
public:
    Error(ErrorCode code, std::string message)
        : code_(code), message_(std::move(message)) {}

    Error(ErrorCode code, std::string message, std::string detail)
        : code_(code), message_(std::move(message)), detail_(std::move(detail)) {}

    [[nodiscard]] auto code() const noexcept -> ErrorCode { return code_; }
    [[nodiscard]] auto message() const noexcept -> std::string_view { return message_; }
    [[nodiscard]] auto detail() const noexcept -> std::string_view { return detail_; }

    [[nodiscard]] auto what() const -> std::string {
        if (detail_.empty()) return message_;
        return message_ + ": " + detail_;
    }

private:
    ErrorCode code_;
    std::string message_;
    std::string detail_;
};

template <typename T>
using Result = std::expected<T, Error>;

using VoidResult = std::expected<void, Error>;

inline auto make_error(ErrorCode code, std::string message) -> Error {
    return Error(code, std::move(message));
}

inline auto make_error(ErrorCode code, std::string message, std::string detail) -> Error {
    return Error(code, std::move(message), std::move(detail));
}

/// Re-tags an error from a lower layer with a workflow-level code, keeping
/// the original text as the detail.
inline auto wrap_error(ErrorCode code, std::string message, const Error& cause) -> Error {
    return Error(code, std::move(message), cause.what());
}

inline auto error_code_to_string(ErrorCode code) -> std::string_view {
    switch (code) {
        case ErrorCode::InvalidConfig: return "INVALID_CONFIG";
        case ErrorCode::IoError: return "IO_ERROR";
        case ErrorCode::Timeout: return "TIMEOUT";
        case ErrorCode::ConnectionFailed: return "CONNECTION_FAILED";
        case ErrorCode::SerializationError: return "SERIALIZATION_ERROR";
        case ErrorCode::ServiceRejected: return "SERVICE_REJECTED";
        case ErrorCode::ScriptNotFound: return "SCRIPT_NOT_FOUND";
        case ErrorCode::PfxNotFound: return "PFX_NOT_FOUND";
        case ErrorCode::ServiceUnreachable: return "SERVICE_UNREACHABLE";
        case ErrorCode::RuntimeUnavailable: return "RUNTIME_UNAVAILABLE";
        case ErrorCode::NoCertificatesFound: return "NO_CERTIFICATES_FOUND";
        case ErrorCode::SignRequestFailed: return "SIGN_REQUEST_FAILED";
        case ErrorCode::VerifyRequestFailed: return "VERIFY_REQUEST_FAILED";
        default: return "UNKNOWN";
    }
}

/// Operator-facing guidance for errors that have an obvious next step.
/// Returns an empty view when there is nothing useful to suggest.
inline auto remediation_hint(ErrorCode code) -> std::string_view {
    switch (code) {
        case ErrorCode::ScriptNotFound:
            return "Check the script path; it must point to an existing file.";
        case ErrorCode::PfxNotFound:
            return "Check the --pfx path; it must point to an existing PKCS#12 file.";
        case ErrorCode::ServiceUnreachable:
            return "Start the signing service (default http://localhost:20000) "
                   "or point --service-url at a running instance.";
        case ErrorCode::RuntimeUnavailable:
            return "The signing service is up but its signing runtime is not; "
                   "install or enable the runtime on the service host and restart the service.";
        case ErrorCode::NoCertificatesFound:
            return "Create a code-signing certificate in the certificate store, "
                   "or pass --pfx <file> --pfx-password <password>.";
        default:
            return {};
    }
}

} // namespace scriptsign
