#include <catch2/catch_test_macros.hpp>

#include "scriptsign/core/error.hpp"

TEST_CASE("Error creation and accessors", "[error]") {
    SECTION("basic error") {
        scriptsign::Error err(scriptsign::ErrorCode::ScriptNotFound, "script not found");
        CHECK(err.code() == scriptsign::ErrorCode::ScriptNotFound);
        CHECK(err.message() == "script not found");
        CHECK(err.detail() == "");
        CHECK(err.what() == "script not found");
    }

    SECTION("error with detail") {
        scriptsign::Error err(scriptsign::ErrorCode::SignRequestFailed,
                              "Signing failed", "Certificate not found");
        CHECK(err.code() == scriptsign::ErrorCode::SignRequestFailed);
        CHECK(err.message() == "Signing failed");
        CHECK(err.detail() == "Certificate not found");
        CHECK(err.what() == "Signing failed: Certificate not found");
    }
}

TEST_CASE("wrap_error keeps the cause as detail", "[error]") {
    auto cause = scriptsign::make_error(scriptsign::ErrorCode::ConnectionFailed,
                                        "HTTP request failed", "Connection failed");
    auto wrapped = scriptsign::wrap_error(scriptsign::ErrorCode::ServiceUnreachable,
                                          "Signing service is unreachable", cause);

    CHECK(wrapped.code() == scriptsign::ErrorCode::ServiceUnreachable);
    CHECK(wrapped.message() == "Signing service is unreachable");
    CHECK(wrapped.detail() == "HTTP request failed: Connection failed");
}

TEST_CASE("Result type error case", "[error]") {
    scriptsign::Result<int> result = std::unexpected(
        scriptsign::make_error(scriptsign::ErrorCode::InvalidConfig, "bad value"));

    REQUIRE_FALSE(result.has_value());
    CHECK(result.error().code() == scriptsign::ErrorCode::InvalidConfig);
    CHECK(result.error().message() == "bad value");
}

TEST_CASE("error_code_to_string covers the workflow codes", "[error]") {
    using scriptsign::ErrorCode;
    using scriptsign::error_code_to_string;

    CHECK(error_code_to_string(ErrorCode::ScriptNotFound) == "SCRIPT_NOT_FOUND");
    CHECK(error_code_to_string(ErrorCode::PfxNotFound) == "PFX_NOT_FOUND");
    CHECK(error_code_to_string(ErrorCode::ServiceUnreachable) == "SERVICE_UNREACHABLE");
    CHECK(error_code_to_string(ErrorCode::RuntimeUnavailable) == "RUNTIME_UNAVAILABLE");
    CHECK(error_code_to_string(ErrorCode::NoCertificatesFound) == "NO_CERTIFICATES_FOUND");
    CHECK(error_code_to_string(ErrorCode::SignRequestFailed) == "SIGN_REQUEST_FAILED");
    CHECK(error_code_to_string(ErrorCode::VerifyRequestFailed) == "VERIFY_REQUEST_FAILED");
}

TEST_CASE("remediation_hint", "[error]") {
    using scriptsign::ErrorCode;
    using scriptsign::remediation_hint;

    SECTION("service errors explain how to start the service") {
        CHECK(remediation_hint(ErrorCode::ServiceUnreachable).find("--service-url")
              != std::string_view::npos);
    }

    SECTION("missing certificates point at --pfx") {
        CHECK(remediation_hint(ErrorCode::NoCertificatesFound).find("--pfx")
              != std::string_view::npos);
    }

    SECTION("transport codes have none") {
        CHECK(remediation_hint(ErrorCode::Timeout).empty());
        CHECK(remediation_hint(ErrorCode::SignRequestFailed).empty());
    }
}
