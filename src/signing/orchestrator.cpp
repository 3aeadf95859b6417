#include "scriptsign/signing/orchestrator.hpp"
#include "scriptsign/core/logger.hpp"
#include "scriptsign/infra/paths.hpp"

#include <utility>

namespace scriptsign::signing {

auto SignedOutcome::final_status() const -> std::string {
    if (verification && !verification->status.empty()) {
        return verification->status;
    }
    return signature.status;
}

auto stage_to_string(SigningStage stage) -> std::string_view {
    switch (stage) {
        case SigningStage::Start: return "start";
        case SigningStage::PathResolved: return "path_resolved";
        case SigningStage::ServiceChecked: return "service_checked";
        case SigningStage::CertResolved: return "cert_resolved";
        case SigningStage::Signed: return "signed";
        case SigningStage::Verified: return "verified";
        case SigningStage::Aborted: return "aborted";
        default: return "unknown";
    }
}

Orchestrator::Orchestrator(SigningService& service)
    : service_(service) {}

void Orchestrator::advance(SigningStage next) {
    LOG_DEBUG("Signing stage: {} -> {}", stage_to_string(stage_), stage_to_string(next));
    stage_ = next;
}

auto Orchestrator::abort_with(Error error) -> Error {
    LOG_DEBUG("Signing aborted in stage {}: [{}] {}", stage_to_string(stage_),
              error_code_to_string(error.code()), error.what());
    stage_ = SigningStage::Aborted;
    return error;
}

auto Orchestrator::run(const SignOptions& options) -> Result<RunOutcome> {
    stage_ = SigningStage::Start;

    auto inputs = resolve_inputs(options);
    if (!inputs) {
        return std::unexpected(abort_with(std::move(inputs.error())));
    }
    advance(SigningStage::PathResolved);

    if (auto live = check_service(); !live) {
        return std::unexpected(abort_with(std::move(live.error())));
    }
    advance(SigningStage::ServiceChecked);

    auto decision = resolve_certificate(options, *inputs);
    if (!decision) {
        return std::unexpected(abort_with(std::move(decision.error())));
    }
    if (auto* choice = std::get_if<CertificateChoiceRequired>(&*decision)) {
        LOG_INFO("No certificate specified; {} available, choose one with --thumbprint",
                 choice->certificates.size());
        return RunOutcome{std::move(*choice)};
    }
    advance(SigningStage::CertResolved);

    auto request = build_sign_request(*inputs, std::get<ExplicitCertificate>(*decision),
                                      options.timestamp_server);
    auto signature = sign(request);
    if (!signature) {
        return std::unexpected(abort_with(std::move(signature.error())));
    }
    advance(SigningStage::Signed);
    LOG_INFO("Signed {} (status: {})", inputs->script_path.string(), signature->status);

    SignedOutcome outcome{
        .script_path = inputs->script_path,
        .signature = std::move(*signature),
        .verification = std::nullopt,
        .verification_warning = std::nullopt,
    };

    // Signing already succeeded; a verification problem is only reported.
    auto verified = request_verification(inputs->script_path);
    if (verified) {
        outcome.verification = std::move(*verified);
    } else {
        LOG_WARN("Verification after signing failed: {}", verified.error().what());
        outcome.verification_warning = std::move(verified.error());
    }
    advance(SigningStage::Verified);

    return RunOutcome{std::move(outcome)};
}

auto Orchestrator::list_certificates() -> Result<std::vector<CertificateDescriptor>> {
    if (auto live = check_service(); !live) {
        return std::unexpected(std::move(live.error()));
    }

    auto certs = fetch_certificates();
    if (!certs) {
        return std::unexpected(std::move(certs.error()));
    }
    if (certs->empty()) {
        return std::unexpected(make_error(
            ErrorCode::NoCertificatesFound, "No code-signing certificates found"));
    }
    return certs;
}

auto Orchestrator::verify(const std::filesystem::path& script_path) -> Result<VerifyData> {
    auto resolved = infra::resolve_existing_file(script_path, ErrorCode::ScriptNotFound);
    if (!resolved) {
        return std::unexpected(std::move(resolved.error()));
    }

    if (auto live = check_service(); !live) {
        return std::unexpected(std::move(live.error()));
    }

    return request_verification(*resolved);
}

auto Orchestrator::check_service() -> VoidResult {
    auto report = service_.check_runtime();
    if (!report) {
        return std::unexpected(wrap_error(
            ErrorCode::ServiceUnreachable, "Signing service is unreachable", report.error()));
    }
    if (!report->available) {
        return std::unexpected(make_error(
            ErrorCode::RuntimeUnavailable,
            "Signing service reports its signing runtime as unavailable"));
    }
    LOG_DEBUG("Signing service is available");
    return {};
}

auto Orchestrator::resolve_inputs(const SignOptions& options) -> Result<ResolvedInputs> {
    auto script = infra::resolve_existing_file(options.script_path, ErrorCode::ScriptNotFound);
    if (!script) {
        return std::unexpected(make_error(
            ErrorCode::ScriptNotFound,
            "Script not found: " + options.script_path.string(),
            std::string(script.error().detail())));
    }

    ResolvedInputs inputs{.script_path = std::move(*script), .pfx_path = std::nullopt};

    if (options.pfx_path) {
        auto pfx = infra::resolve_existing_file(*options.pfx_path, ErrorCode::PfxNotFound);
        if (!pfx) {
            return std::unexpected(make_error(
                ErrorCode::PfxNotFound,
                "PFX file not found: " + options.pfx_path->string(),
                std::string(pfx.error().detail())));
        }
        inputs.pfx_path = std::move(*pfx);
    }

    return inputs;
}

auto Orchestrator::resolve_certificate(const SignOptions& options,
                                       const ResolvedInputs& inputs)
    -> Result<CertificateDecision> {
    if (options.cert_thumbprint || inputs.pfx_path) {
        return CertificateDecision{ExplicitCertificate{
            .thumbprint = options.cert_thumbprint,
            .pfx_path = inputs.pfx_path,
            .pfx_password = options.pfx_password,
        }};
    }

    auto certs = fetch_certificates();
    if (!certs) {
        return std::unexpected(std::move(certs.error()));
    }
    if (certs->empty()) {
        return std::unexpected(make_error(
            ErrorCode::NoCertificatesFound, "No code-signing certificates found"));
    }

    // Never pick one implicitly, not even when there is only one.
    return CertificateDecision{CertificateChoiceRequired{std::move(*certs)}};
}

auto Orchestrator::fetch_certificates() -> Result<std::vector<CertificateDescriptor>> {
    auto certs = service_.list_certificates();
    if (!certs) {
        return std::unexpected(wrap_error(
            ErrorCode::ServiceUnreachable, "Could not list certificates", certs.error()));
    }
    return certs;
}

auto Orchestrator::sign(const SignRequest& request) -> Result<SignatureData> {
    auto result = service_.sign_script(request);
    if (!result) {
        return std::unexpected(wrap_error(
            ErrorCode::SignRequestFailed, "Signing request failed", result.error()));
    }
    if (!result->success) {
        return std::unexpected(make_error(
            ErrorCode::SignRequestFailed, "Signing failed",
            result->error.value_or("service reported failure without a message")));
    }
    return result->data.value_or(SignatureData{});
}

auto Orchestrator::request_verification(const std::filesystem::path& script_path)
    -> Result<VerifyData> {
    auto result = service_.verify_signature(script_path.string());
    if (!result) {
        return std::unexpected(wrap_error(
            ErrorCode::VerifyRequestFailed, "Verification request failed", result.error()));
    }
    if (!result->success) {
        return std::unexpected(make_error(
            ErrorCode::VerifyRequestFailed, "Verification failed",
            result->error.value_or("service reported failure without a message")));
    }
    return result->data.value_or(VerifyData{});
}

auto build_sign_request(const ResolvedInputs& inputs,
                        const ExplicitCertificate& identity,
                        const std::optional<std::string>& timestamp_server)
    -> SignRequest {
    SignRequest request;
    request.script_path = inputs.script_path.string();
    request.cert_thumbprint = identity.thumbprint;
    if (identity.pfx_path) {
        request.pfx_path = identity.pfx_path->string();
        request.pfx_password = identity.pfx_password;
    }
    request.timestamp_server = timestamp_server;
    return request;
}

auto exit_code_for(const Result<RunOutcome>& result) -> int {
    return result.has_value() ? 0 : 1;
}

} // namespace scriptsign::signing
