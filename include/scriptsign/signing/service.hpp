#pragma once

#include <memory>
#include <string>
#include <string_view>
#include <vector>

#include "scriptsign/core/config.hpp"
#include "scriptsign/core/error.hpp"
#include "scriptsign/infra/http_client.hpp"
#include "scriptsign/signing/types.hpp"

namespace scriptsign::signing {

/// Abstract client for the code-signing service.
///
/// Implementations report transport problems and non-2xx answers as errors
/// (ConnectionFailed, Timeout, ServiceRejected, SerializationError). A
/// well-formed answer with `success=false` is returned as a value; deciding
/// what it means is up to the caller.
class SigningService {
public:
    virtual ~SigningService() = default;

    /// GET /api/check-powershell
    virtual auto check_runtime() -> Result<LivenessReport> = 0;

    /// GET /api/list-certificates, in service order.
    virtual auto list_certificates() -> Result<std::vector<CertificateDescriptor>> = 0;

    /// POST /api/sign-script
    virtual auto sign_script(const SignRequest& request) -> Result<SignResult> = 0;

    /// POST /api/verify-signature
    virtual auto verify_signature(std::string_view script_path) -> Result<VerifyResult> = 0;
};

/// SigningService over HTTP+JSON.
class HttpSigningService : public SigningService {
public:
    explicit HttpSigningService(const ServiceConfig& config);
    ~HttpSigningService() override;

    auto check_runtime() -> Result<LivenessReport> override;
    auto list_certificates() -> Result<std::vector<CertificateDescriptor>> override;
    auto sign_script(const SignRequest& request) -> Result<SignResult> override;
    auto verify_signature(std::string_view script_path) -> Result<VerifyResult> override;

    [[nodiscard]] auto base_url() const -> const std::string&;

private:
    /// Turns a transport result into a parsed JSON body, resolving non-2xx
    /// bodies into a ServiceError once, here.
    auto decode(std::string_view what, Result<infra::HttpResponse> response)
        -> Result<json>;

    ServiceConfig config_;
    infra::HttpClient http_;
};

} // namespace scriptsign::signing
