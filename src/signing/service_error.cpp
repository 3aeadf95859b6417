#include "scriptsign/signing/service_error.hpp"

#include <nlohmann/json.hpp>

namespace scriptsign::signing {

using json = nlohmann::json;

auto parse_service_error(std::string_view body) -> ServiceError {
    auto j = json::parse(body, nullptr, /*allow_exceptions=*/false);
    if (j.is_discarded() || !j.is_object()) {
        return RawError{std::string(body)};
    }

    if (auto it = j.find("error"); it != j.end()) {
        if (it->is_string()) {
            return StructuredError{it->get<std::string>()};
        }
        if (it->is_object()) {
            if (auto msg = it->find("message"); msg != it->end() && msg->is_string()) {
                return StructuredError{msg->get<std::string>()};
            }
        }
    }

    if (auto it = j.find("message"); it != j.end() && it->is_string()) {
        return StructuredError{it->get<std::string>()};
    }

    return RawError{std::string(body)};
}

auto describe(const ServiceError& error) -> std::string {
    if (const auto* s = std::get_if<StructuredError>(&error)) {
        return s->message;
    }
    const auto& raw = std::get<RawError>(error);
    return raw.text.empty() ? std::string("(empty response body)") : raw.text;
}

} // namespace scriptsign::signing
