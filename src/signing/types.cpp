#include "scriptsign/signing/types.hpp"

#include <array>
#include <string_view>

namespace scriptsign::signing {

namespace {

auto optional_string(const json& j, const char* key) -> std::optional<std::string> {
    if (!j.contains(key) || j[key].is_null()) {
        return std::nullopt;
    }
    const auto& v = j[key];
    return v.is_string() ? v.get<std::string>() : v.dump();
}

/// Reads a string field that services sometimes render as a number or enum
/// ordinal. Missing and null both become an empty string.
auto loose_string(const json& j, const char* key) -> std::string {
    if (!j.contains(key) || j[key].is_null()) {
        return {};
    }
    const auto& v = j[key];
    if (v.is_string()) {
        return v.get<std::string>();
    }
    return v.dump();
}

} // anonymous namespace

void to_json(json& j, const CertificateDescriptor& c) {
    j = json{
        {"Subject", c.subject},
        {"Thumbprint", c.thumbprint},
        {"NotAfter", c.not_after},
    };
}

void from_json(const json& j, CertificateDescriptor& c) {
    c.subject = loose_string(j, "Subject");
    c.thumbprint = j.at("Thumbprint").get<std::string>();
    c.not_after = loose_string(j, "NotAfter");
}

void to_json(json& j, const SignRequest& r) {
    j = json{{"scriptPath", r.script_path}};
    if (r.cert_thumbprint) j["certThumbprint"] = *r.cert_thumbprint;
    if (r.pfx_path) j["pfxPath"] = *r.pfx_path;
    if (r.pfx_password) j["pfxPassword"] = *r.pfx_password;
    if (r.timestamp_server) j["timestampServer"] = *r.timestamp_server;
}

void from_json(const json& j, SignatureData& d) {
    d.status = loose_string(j, "Status");
    d.signed_by = loose_string(j, "SignedBy");
    d.time_stamper = optional_string(j, "TimeStamper");
    d.signature_type = loose_string(j, "SignatureType");
}

void from_json(const json& j, SignResult& r) {
    r.success = j.at("success").get<bool>();
    if (j.contains("data") && j["data"].is_object()) {
        r.data = j["data"].get<SignatureData>();
    }
    r.error = optional_string(j, "error");
}

void from_json(const json& j, VerifyData& d) {
    d.status = loose_string(j, "Status");
    d.signed_by = optional_string(j, "SignedBy");
    d.time_stamper = optional_string(j, "TimeStamper");
}

void from_json(const json& j, VerifyResult& r) {
    r.success = j.at("success").get<bool>();
    if (j.contains("data") && j["data"].is_object()) {
        r.data = j["data"].get<VerifyData>();
    }
    r.error = optional_string(j, "error");
}

auto redact_request_json(json j) -> json {
    static constexpr std::array<std::string_view, 2> sensitive_keys = {
        "pfxPassword", "password",
    };

    if (!j.is_object()) {
        return j;
    }
    for (auto it = j.begin(); it != j.end(); ++it) {
        for (auto key : sensitive_keys) {
            if (it.key() == key && it->is_string() && !it->get<std::string>().empty()) {
                *it = "***REDACTED***";
                break;
            }
        }
    }
    return j;
}

} // namespace scriptsign::signing
