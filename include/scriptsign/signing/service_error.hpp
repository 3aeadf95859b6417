#pragma once

#include <string>
#include <string_view>
#include <variant>

namespace scriptsign::signing {

/// Error body the service sent as JSON with a recognizable message field.
struct StructuredError {
    std::string message;
};

/// Error body that did not parse as structured data; kept verbatim.
struct RawError {
    std::string text;
};

using ServiceError = std::variant<StructuredError, RawError>;

/// Classifies an error response body. Recognized shapes, in order:
/// `{"error": "..."}`, `{"error": {"message": "..."}}`, `{"message": "..."}`.
/// Anything else, including an empty body, becomes RawError.
auto parse_service_error(std::string_view body) -> ServiceError;

/// Human-readable text for either alternative.
auto describe(const ServiceError& error) -> std::string;

} // namespace scriptsign::signing
