#include "scriptsign/infra/http_client.hpp"
#include "scriptsign/core/logger.hpp"

#include <httplib.h>

#include <memory>
#include <utility>

namespace scriptsign::infra {

namespace {

auto to_http_response(const httplib::Result& result) -> Result<HttpResponse> {
    if (!result) {
        auto err = result.error();
        if (err == httplib::Error::ConnectionTimeout) {
            return std::unexpected(make_error(
                ErrorCode::Timeout, "HTTP request timed out", httplib::to_string(err)));
        }
        return std::unexpected(make_error(
            ErrorCode::ConnectionFailed, "HTTP request failed", httplib::to_string(err)));
    }

    HttpResponse response;
    response.status = result->status;
    response.body = result->body;

    return response;
}

} // anonymous namespace

struct HttpClient::Impl {
    HttpClientConfig config;
    std::unique_ptr<httplib::Client> client;

    explicit Impl(HttpClientConfig config_) : config(std::move(config_)) {
        client = std::make_unique<httplib::Client>(config.base_url);
        apply_timeout(config.timeout);

        if (!config.verify_ssl) {
            client->enable_server_certificate_verification(false);
        }

        apply_default_headers();

        LOG_DEBUG("HTTP client created for {}", config.base_url);
    }

    void apply_timeout(std::chrono::milliseconds timeout) {
        client->set_connection_timeout(timeout);
        client->set_read_timeout(timeout);
        client->set_write_timeout(timeout);
    }

    void apply_default_headers() {
        httplib::Headers hdrs;
        for (const auto& [key, value] : config.default_headers) {
            hdrs.emplace(key, value);
        }
        client->set_default_headers(hdrs);
    }
};

HttpClient::HttpClient(HttpClientConfig config)
    : impl_(std::make_unique<Impl>(std::move(config))) {}

HttpClient::~HttpClient() = default;


auto HttpClient::get(std::string_view path,
                     std::optional<std::chrono::milliseconds> timeout)
    -> Result<HttpResponse> {
    impl_->apply_timeout(timeout.value_or(impl_->config.timeout));
    LOG_DEBUG("GET {}{}", impl_->config.base_url, path);
    auto res = impl_->client->Get(std::string(path));
    return to_http_response(res);
}

auto HttpClient::post(std::string_view path,
                      std::string_view body,
                      std::string_view content_type,
                      std::optional<std::chrono::milliseconds> timeout)
    -> Result<HttpResponse> {
    impl_->apply_timeout(timeout.value_or(impl_->config.timeout));
    LOG_DEBUG("POST {}{}", impl_->config.base_url, path);
    auto res = impl_->client->Post(std::string(path), std::string(body),
                                   std::string(content_type));
    return to_http_response(res);
}

auto HttpClient::base_url() const -> const std::string& {
    return impl_->config.base_url;
}

} // namespace scriptsign::infra
