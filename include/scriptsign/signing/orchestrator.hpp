#pragma once

#include <filesystem>
#include <optional>
#include <string>
#include <string_view>
#include <variant>
#include <vector>

#include "scriptsign/core/error.hpp"
#include "scriptsign/signing/service.hpp"
#include "scriptsign/signing/types.hpp"

namespace scriptsign::signing {

/// What the operator asked for on the command line.
struct SignOptions {
    std::filesystem::path script_path;
    std::optional<std::string> cert_thumbprint;
    std::optional<std::filesystem::path> pfx_path;
    std::optional<std::string> pfx_password;
    std::optional<std::string> timestamp_server;
};

/// Inputs after canonicalization. Only produced when every named file exists.
struct ResolvedInputs {
    std::filesystem::path script_path;
    std::optional<std::filesystem::path> pfx_path;
};

/// The operator named a signing identity explicitly.
struct ExplicitCertificate {
    std::optional<std::string> thumbprint;
    std::optional<std::filesystem::path> pfx_path;
    std::optional<std::string> pfx_password;
};

/// No identity was named; the operator has to pick one from this list.
/// Order is the service's order.
struct CertificateChoiceRequired {
    std::vector<CertificateDescriptor> certificates;
};

using CertificateDecision = std::variant<ExplicitCertificate, CertificateChoiceRequired>;

/// A completed signing run. `verification` is set when the verify call
/// succeeded; otherwise `verification_warning` says why it did not.
struct SignedOutcome {
    std::filesystem::path script_path;
    SignatureData signature;
    std::optional<VerifyData> verification;
    std::optional<Error> verification_warning;

    /// Verified status when the service reported one, the sign status otherwise.
    [[nodiscard]] auto final_status() const -> std::string;
};

using RunOutcome = std::variant<CertificateChoiceRequired, SignedOutcome>;

enum class SigningStage {
    Start,
    PathResolved,
    ServiceChecked,
    CertResolved,
    Signed,
    Verified,
    Aborted,
};

auto stage_to_string(SigningStage stage) -> std::string_view;

/// Drives one sign-then-verify run against a SigningService.
///
/// The run is strictly linear: inputs are resolved before any request, the
/// liveness probe precedes every other call, a signing identity must be
/// named explicitly, and verification only follows a successful sign. Any
/// failure before signing completes aborts the run. A failed verification
/// after a successful sign is kept as a warning on the outcome.
class Orchestrator {
public:
    explicit Orchestrator(SigningService& service);

    Orchestrator(const Orchestrator&) = delete;
    Orchestrator& operator=(const Orchestrator&) = delete;

    /// Full workflow. Errors are the abort reasons (ScriptNotFound,
    /// PfxNotFound, ServiceUnreachable, RuntimeUnavailable,
    /// NoCertificatesFound, SignRequestFailed).
    auto run(const SignOptions& options) -> Result<RunOutcome>;

    /// Inventory query behind a liveness check. An empty inventory is a
    /// NoCertificatesFound error.
    auto list_certificates() -> Result<std::vector<CertificateDescriptor>>;

    /// Verify-only run. Here a failed verification is the error.
    auto verify(const std::filesystem::path& script_path) -> Result<VerifyData>;

    /// Liveness probe mapped onto ServiceUnreachable / RuntimeUnavailable.
    auto check_service() -> VoidResult;

    [[nodiscard]] auto stage() const noexcept -> SigningStage { return stage_; }

private:
    auto resolve_inputs(const SignOptions& options) -> Result<ResolvedInputs>;
    auto resolve_certificate(const SignOptions& options, const ResolvedInputs& inputs)
        -> Result<CertificateDecision>;
    auto fetch_certificates() -> Result<std::vector<CertificateDescriptor>>;
    auto sign(const SignRequest& request) -> Result<SignatureData>;
    auto request_verification(const std::filesystem::path& script_path) -> Result<VerifyData>;

    void advance(SigningStage next);
    auto abort_with(Error error) -> Error;

    SigningService& service_;
    SigningStage stage_ = SigningStage::Start;
};

/// Builds the wire request from resolved inputs and the chosen identity.
auto build_sign_request(const ResolvedInputs& inputs,
                        const ExplicitCertificate& identity,
                        const std::optional<std::string>& timestamp_server)
    -> SignRequest;

/// 0 for a completed run or an informational certificate listing, 1 for
/// any abort.
auto exit_code_for(const Result<RunOutcome>& result) -> int;

} // namespace scriptsign::signing
