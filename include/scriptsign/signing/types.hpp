#pragma once

#include <optional>
#include <string>
#include <vector>

#include <nlohmann/json.hpp>

namespace scriptsign::signing {

using json = nlohmann::json;

/// One entry of the service's certificate inventory. Field names follow the
/// wire format (PascalCase).
struct CertificateDescriptor {
    std::string subject;
    std::string thumbprint;
    std::string not_after;  // as rendered by the service
};

void to_json(json& j, const CertificateDescriptor& c);
void from_json(const json& j, CertificateDescriptor& c);

struct SignRequest {
    std::string script_path;
    std::optional<std::string> cert_thumbprint;
    std::optional<std::string> pfx_path;
    std::optional<std::string> pfx_password;
    std::optional<std::string> timestamp_server;
};

/// Absent optionals are omitted from the body rather than sent as null.
void to_json(json& j, const SignRequest& r);

struct SignatureData {
    std::string status;
    std::string signed_by;
    std::optional<std::string> time_stamper;
    std::string signature_type;
};

void from_json(const json& j, SignatureData& d);

struct SignResult {
    bool success = false;
    std::optional<SignatureData> data;
    std::optional<std::string> error;
};

void from_json(const json& j, SignResult& r);

struct VerifyData {
    std::string status;
    std::optional<std::string> signed_by;
    std::optional<std::string> time_stamper;
};

void from_json(const json& j, VerifyData& d);

struct VerifyResult {
    bool success = false;
    std::optional<VerifyData> data;
    std::optional<std::string> error;
};

void from_json(const json& j, VerifyResult& r);

struct LivenessReport {
    bool available = false;
};

/// Returns a copy of a serialized request with secrets masked, for logging.
auto redact_request_json(json j) -> json;

} // namespace scriptsign::signing
