#include "scriptsign/signing/service.hpp"
#include "scriptsign/core/logger.hpp"
#include "scriptsign/signing/service_error.hpp"

#include <chrono>
#include <utility>

namespace scriptsign::signing {

namespace {

constexpr auto kCheckRuntimePath = "/api/check-powershell";
constexpr auto kListCertificatesPath = "/api/list-certificates";
constexpr auto kSignScriptPath = "/api/sign-script";
constexpr auto kVerifySignaturePath = "/api/verify-signature";

/// Serializes a request body. Strings that are not valid UTF-8 (a Latin-1
/// file name, say) cannot be encoded as JSON and yield SerializationError.
auto encode_request(std::string_view what, const json& payload) -> Result<std::string> {
    try {
        return payload.dump();
    } catch (const json::exception& e) {
        return std::unexpected(make_error(
            ErrorCode::SerializationError,
            "Cannot encode " + std::string(what) + " request", e.what()));
    }
}

} // anonymous namespace

HttpSigningService::HttpSigningService(const ServiceConfig& config)
    : config_(config)
    , http_(infra::HttpClientConfig{
          .base_url = config.base_url,
          .timeout = std::chrono::seconds(config.request_timeout_seconds),
          .verify_ssl = true,
          .default_headers = {
              {"Accept", "application/json"},
          },
      })
{
    LOG_DEBUG("Signing service client for {}", config_.base_url);
}

HttpSigningService::~HttpSigningService() = default;

auto HttpSigningService::base_url() const -> const std::string& {
    return config_.base_url;
}

auto HttpSigningService::decode(std::string_view what,
                                Result<infra::HttpResponse> response)
    -> Result<json> {
    if (!response) {
        return std::unexpected(std::move(response.error()));
    }

    if (!response->is_success()) {
        auto service_error = parse_service_error(response->body);
        LOG_DEBUG("{} returned HTTP {}", what, response->status);
        return std::unexpected(make_error(
            ErrorCode::ServiceRejected,
            std::string(what) + " returned HTTP " + std::to_string(response->status),
            describe(service_error)));
    }

    auto body = json::parse(response->body, nullptr, /*allow_exceptions=*/false);
    if (body.is_discarded() || !body.is_object()) {
        return std::unexpected(make_error(
            ErrorCode::SerializationError,
            std::string(what) + " returned a malformed response",
            response->body));
    }
    return body;
}

auto HttpSigningService::check_runtime() -> Result<LivenessReport> {
    auto body = decode("check-powershell",
                       http_.get(kCheckRuntimePath,
                                 std::chrono::milliseconds(config_.liveness_timeout_ms)));
    if (!body) {
        return std::unexpected(std::move(body.error()));
    }

    LivenessReport report;
    if (auto it = body->find("available"); it != body->end() && it->is_boolean()) {
        report.available = it->get<bool>();
    }
    return report;
}

auto HttpSigningService::list_certificates()
    -> Result<std::vector<CertificateDescriptor>> {
    auto body = decode("list-certificates", http_.get(kListCertificatesPath));
    if (!body) {
        return std::unexpected(std::move(body.error()));
    }

    try {
        std::vector<CertificateDescriptor> certs;
        if (auto it = body->find("certificates"); it != body->end() && !it->is_null()) {
            certs = it->get<std::vector<CertificateDescriptor>>();
        }
        LOG_DEBUG("Service listed {} certificate(s)", certs.size());
        return certs;
    } catch (const json::exception& e) {
        return std::unexpected(make_error(
            ErrorCode::SerializationError, "Malformed certificate list", e.what()));
    }
}

auto HttpSigningService::sign_script(const SignRequest& request) -> Result<SignResult> {
    json payload = request;
    auto encoded = encode_request("sign-script", payload);
    if (!encoded) {
        return std::unexpected(std::move(encoded.error()));
    }
    LOG_DEBUG("sign-script request: {}", redact_request_json(payload).dump());

    auto body = decode("sign-script", http_.post(kSignScriptPath, *encoded));
    if (!body) {
        return std::unexpected(std::move(body.error()));
    }

    try {
        return body->get<SignResult>();
    } catch (const json::exception& e) {
        return std::unexpected(make_error(
            ErrorCode::SerializationError, "Malformed sign-script response", e.what()));
    }
}

auto HttpSigningService::verify_signature(std::string_view script_path)
    -> Result<VerifyResult> {
    json payload = {{"scriptPath", std::string(script_path)}};
    auto encoded = encode_request("verify-signature", payload);
    if (!encoded) {
        return std::unexpected(std::move(encoded.error()));
    }

    auto body = decode("verify-signature", http_.post(kVerifySignaturePath, *encoded));
    if (!body) {
        return std::unexpected(std::move(body.error()));
    }

    try {
        return body->get<VerifyResult>();
    } catch (const json::exception& e) {
        return std::unexpected(make_error(
            ErrorCode::SerializationError, "Malformed verify-signature response", e.what()));
    }
}

} // namespace scriptsign::signing
