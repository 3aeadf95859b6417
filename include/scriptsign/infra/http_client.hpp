#pragma once

#include <chrono>
#include <map>
#include <memory>
#include <optional>
#include <string>
#include <string_view>

#include "scriptsign/core/error.hpp"

namespace scriptsign::infra {

/// HTTP response from the client.
struct HttpResponse {
    int status = 0;
    std::string body;

    /// Returns true if the status code indicates success (2xx).
    [[nodiscard]] auto is_success() const noexcept -> bool {
        return status >= 200 && status < 300;
    }
};

/// Configuration for the HTTP client.
struct HttpClientConfig {
    std::string base_url;
    std::chrono::milliseconds timeout{30000};
    bool verify_ssl = true;
    std::map<std::string, std::string> default_headers;
};

/// Blocking HTTP client wrapping cpp-httplib.
///
/// Each call may override the configured timeout; the override applies to
/// connect, read and write of that one request. Transport failures are
/// reported as ConnectionFailed or Timeout errors, never as exceptions.
class HttpClient {
public:
    explicit HttpClient(HttpClientConfig config);
    ~HttpClient();

    HttpClient(const HttpClient&) = delete;
    HttpClient& operator=(const HttpClient&) = delete;

    auto get(std::string_view path,
             std::optional<std::chrono::milliseconds> timeout = std::nullopt)
        -> Result<HttpResponse>;

    auto post(std::string_view path,
              std::string_view body,
              std::string_view content_type = "application/json",
              std::optional<std::chrono::milliseconds> timeout = std::nullopt)
        -> Result<HttpResponse>;

    [[nodiscard]] auto base_url() const -> const std::string&;

private:
    struct Impl;
    std::unique_ptr<Impl> impl_;
};

} // namespace scriptsign::infra
