#include <catch2/catch_test_macros.hpp>

#include "scriptsign/signing/service_error.hpp"
#include "scriptsign/signing/types.hpp"

using namespace scriptsign::signing;
using json = nlohmann::json;

TEST_CASE("SignRequest serialization", "[signing][types]") {
    SECTION("only scriptPath when nothing optional is set") {
        SignRequest req;
        req.script_path = "/work/build.ps1";

        json j = req;
        CHECK(j.size() == 1);
        CHECK(j["scriptPath"] == "/work/build.ps1");
    }

    SECTION("all fields use the wire names") {
        SignRequest req;
        req.script_path = "/work/build.ps1";
        req.cert_thumbprint = "AAA111";
        req.pfx_path = "/keys/dev.pfx";
        req.pfx_password = "pw";
        req.timestamp_server = "http://ts.example.test";

        json j = req;
        CHECK(j["certThumbprint"] == "AAA111");
        CHECK(j["pfxPath"] == "/keys/dev.pfx");
        CHECK(j["pfxPassword"] == "pw");
        CHECK(j["timestampServer"] == "http://ts.example.test");
    }
}

TEST_CASE("redact_request_json masks the PFX password", "[signing][types]") {
    SignRequest req;
    req.script_path = "/work/build.ps1";
    req.pfx_password = "hunter2";

    auto redacted = redact_request_json(json(req));

    CHECK(redacted["pfxPassword"] == "***REDACTED***");
    CHECK(redacted["scriptPath"] == "/work/build.ps1");
    CHECK(redacted.dump().find("hunter2") == std::string::npos);
}

TEST_CASE("Certificate list parsing", "[signing][types]") {
    auto j = json::parse(R"({
        "certificates": [
            {"Subject": "CN=Dev", "Thumbprint": "AAA111", "NotAfter": "2027-03-01T12:00:00"},
            {"Subject": "CN=Ops", "Thumbprint": "BBB222", "NotAfter": null}
        ]
    })");

    auto certs = j["certificates"].get<std::vector<CertificateDescriptor>>();

    REQUIRE(certs.size() == 2);
    CHECK(certs[0].subject == "CN=Dev");
    CHECK(certs[0].thumbprint == "AAA111");
    CHECK(certs[0].not_after == "2027-03-01T12:00:00");
    CHECK(certs[1].not_after.empty());
}

TEST_CASE("Certificate without thumbprint is rejected", "[signing][types]") {
    auto j = json::parse(R"({"Subject": "CN=Dev"})");
    CHECK_THROWS_AS(j.get<CertificateDescriptor>(), json::exception);
}

TEST_CASE("SignResult parsing", "[signing][types]") {
    SECTION("success with data") {
        auto r = json::parse(R"({
            "success": true,
            "data": {"Status": "Valid", "SignedBy": "CN=Dev", "TimeStamper": "CN=TSA", "SignatureType": "Authenticode"}
        })").get<SignResult>();

        CHECK(r.success);
        REQUIRE(r.data.has_value());
        CHECK(r.data->status == "Valid");
        CHECK(r.data->signed_by == "CN=Dev");
        CHECK(r.data->time_stamper == "CN=TSA");
        CHECK(r.data->signature_type == "Authenticode");
        CHECK_FALSE(r.error.has_value());
    }

    SECTION("numeric status is kept as text") {
        auto r = json::parse(R"({"success": true, "data": {"Status": 0}})").get<SignResult>();
        REQUIRE(r.data.has_value());
        CHECK(r.data->status == "0");
        CHECK_FALSE(r.data->time_stamper.has_value());
    }

    SECTION("failure with error") {
        auto r = json::parse(R"({"success": false, "error": "Certificate not found"})")
                     .get<SignResult>();
        CHECK_FALSE(r.success);
        CHECK_FALSE(r.data.has_value());
        CHECK(r.error == "Certificate not found");
    }
}

TEST_CASE("VerifyResult parsing", "[signing][types]") {
    auto r = json::parse(R"({"success": true, "data": {"Status": "Valid", "SignedBy": "CN=Dev"}})")
                 .get<VerifyResult>();
    CHECK(r.success);
    REQUIRE(r.data.has_value());
    CHECK(r.data->status == "Valid");
    CHECK(r.data->signed_by == "CN=Dev");
}

TEST_CASE("Service error classification", "[signing][service_error]") {
    SECTION("error string") {
        auto e = parse_service_error(R"({"success": false, "error": "Access denied"})");
        REQUIRE(std::holds_alternative<StructuredError>(e));
        CHECK(std::get<StructuredError>(e).message == "Access denied");
        CHECK(describe(e) == "Access denied");
    }

    SECTION("nested error message") {
        auto e = parse_service_error(R"({"error": {"message": "Bad thumbprint"}})");
        REQUIRE(std::holds_alternative<StructuredError>(e));
        CHECK(describe(e) == "Bad thumbprint");
    }

    SECTION("message field") {
        auto e = parse_service_error(R"({"message": "Internal error"})");
        REQUIRE(std::holds_alternative<StructuredError>(e));
        CHECK(describe(e) == "Internal error");
    }

    SECTION("plain text") {
        auto e = parse_service_error("Service Unavailable");
        REQUIRE(std::holds_alternative<RawError>(e));
        CHECK(describe(e) == "Service Unavailable");
    }

    SECTION("JSON without a message is raw") {
        auto e = parse_service_error(R"({"code": 17})");
        REQUIRE(std::holds_alternative<RawError>(e));
        CHECK(describe(e) == R"({"code": 17})");
    }

    SECTION("empty body") {
        auto e = parse_service_error("");
        REQUIRE(std::holds_alternative<RawError>(e));
        CHECK(describe(e) == "(empty response body)");
    }
}
