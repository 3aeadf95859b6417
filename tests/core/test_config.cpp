#include <catch2/catch_test_macros.hpp>

#include <cstdlib>
#include <filesystem>
#include <fstream>

#include "scriptsign/core/config.hpp"

namespace fs = std::filesystem;

TEST_CASE("default_config returns sane defaults", "[config]") {
    auto cfg = scriptsign::default_config();

    SECTION("service defaults") {
        CHECK(cfg.service.base_url == "http://localhost:20000");
        CHECK(cfg.service.liveness_timeout_ms == 2000);
        CHECK(cfg.service.request_timeout_seconds == 120);
    }

    SECTION("port scan defaults") {
        CHECK(cfg.ports.start_port == 11000);
        CHECK(cfg.ports.end_port == 12000);
        CHECK(cfg.ports.probe_timeout_ms == 200);
        CHECK(cfg.ports.host == "localhost");
    }

    CHECK(cfg.log_level == "info");
    CHECK(scriptsign::validate_config(cfg).has_value());
}

TEST_CASE("load_config parses JSON file correctly", "[config]") {
    auto tmp = fs::temp_directory_path() / "scriptsign_test_config.json";
    {
        std::ofstream out(tmp);
        out << R"({
            "service": {
                "base_url": "http://127.0.0.1:21000"
            },
            "ports": {
                "start_port": 15000
            },
            "log_level": "debug"
        })";
    }

    auto cfg = scriptsign::load_config(tmp);

    REQUIRE(cfg.has_value());
    CHECK(cfg->service.base_url == "http://127.0.0.1:21000");
    CHECK(cfg->ports.start_port == 15000);
    CHECK(cfg->log_level == "debug");
    // Non-specified fields keep defaults
    CHECK(cfg->service.liveness_timeout_ms == 2000);
    CHECK(cfg->ports.end_port == 12000);

    fs::remove(tmp);
}

TEST_CASE("load_config expands environment references", "[config]") {
    ::setenv("SCRIPTSIGN_TEST_SERVICE_PORT", "23456", 1);

    auto tmp = fs::temp_directory_path() / "scriptsign_test_config_env.json";
    {
        std::ofstream out(tmp);
        out << R"({"service": {"base_url": "http://localhost:${SCRIPTSIGN_TEST_SERVICE_PORT}"}})";
    }

    auto cfg = scriptsign::load_config(tmp);

    REQUIRE(cfg.has_value());
    CHECK(cfg->service.base_url == "http://localhost:23456");

    fs::remove(tmp);
    ::unsetenv("SCRIPTSIGN_TEST_SERVICE_PORT");
}

TEST_CASE("load_config reports problems", "[config]") {
    SECTION("missing file") {
        auto cfg = scriptsign::load_config(fs::temp_directory_path() / "scriptsign_no_such.json");
        REQUIRE_FALSE(cfg.has_value());
        CHECK(cfg.error().code() == scriptsign::ErrorCode::InvalidConfig);
    }

    SECTION("invalid JSON") {
        auto tmp = fs::temp_directory_path() / "scriptsign_test_config_bad.json";
        {
            std::ofstream out(tmp);
            out << "{ not json";
        }
        auto cfg = scriptsign::load_config(tmp);
        REQUIRE_FALSE(cfg.has_value());
        CHECK(cfg.error().code() == scriptsign::ErrorCode::InvalidConfig);
        fs::remove(tmp);
    }
}

TEST_CASE("load_config_from_env overrides the base", "[config]") {
    ::setenv("SCRIPTSIGN_SERVICE_URL", "http://signer.local:30000", 1);
    ::setenv("SCRIPTSIGN_LOG_LEVEL", "warn", 1);

    scriptsign::Config base;
    base.ports.start_port = 13000;
    auto cfg = scriptsign::load_config_from_env(base);

    CHECK(cfg.service.base_url == "http://signer.local:30000");
    CHECK(cfg.log_level == "warn");
    CHECK(cfg.ports.start_port == 13000);

    ::unsetenv("SCRIPTSIGN_SERVICE_URL");
    ::unsetenv("SCRIPTSIGN_LOG_LEVEL");
}

TEST_CASE("validate_config rejects bad values", "[config]") {
    auto cfg = scriptsign::default_config();

    SECTION("non-http URL") {
        cfg.service.base_url = "localhost:20000";
        CHECK_FALSE(scriptsign::validate_config(cfg).has_value());
    }

    SECTION("zero port") {
        cfg.ports.start_port = 0;
        CHECK_FALSE(scriptsign::validate_config(cfg).has_value());
    }

    SECTION("port above 65535") {
        cfg.ports.end_port = 65536;
        CHECK_FALSE(scriptsign::validate_config(cfg).has_value());
    }

    SECTION("upper bound is accepted") {
        cfg.ports.end_port = 65535;
        CHECK(scriptsign::validate_config(cfg).has_value());
    }

    SECTION("non-positive timeout") {
        cfg.service.liveness_timeout_ms = 0;
        CHECK_FALSE(scriptsign::validate_config(cfg).has_value());
    }
}

TEST_CASE("resolve_env_refs", "[config]") {
    ::setenv("SCRIPTSIGN_TEST_VAR", "value", 1);

    CHECK(scriptsign::resolve_env_refs("a-${SCRIPTSIGN_TEST_VAR}-b") == "a-value-b");
    CHECK(scriptsign::resolve_env_refs("$${SCRIPTSIGN_TEST_VAR}") == "${SCRIPTSIGN_TEST_VAR}");
    CHECK(scriptsign::resolve_env_refs("${SCRIPTSIGN_TEST_UNSET_VAR}") == "${SCRIPTSIGN_TEST_UNSET_VAR}");
    CHECK(scriptsign::resolve_env_refs("plain") == "plain");

    ::unsetenv("SCRIPTSIGN_TEST_VAR");
}

TEST_CASE("Out-of-range ports in a config file are not truncated", "[config]") {
    auto tmp = fs::temp_directory_path() / "scriptsign_test_config_ports.json";
    {
        std::ofstream out(tmp);
        out << R"({"ports": {"start_port": 70000, "end_port": -1}})";
    }

    auto cfg = scriptsign::load_config(tmp);
    fs::remove(tmp);

    REQUIRE(cfg.has_value());
    CHECK(cfg->ports.start_port == 70000);
    CHECK(cfg->ports.end_port == -1);

    auto valid = scriptsign::validate_config(*cfg);
    REQUIRE_FALSE(valid.has_value());
    CHECK(valid.error().code() == scriptsign::ErrorCode::InvalidConfig);
    CHECK(valid.error().detail() == "70000");
}
