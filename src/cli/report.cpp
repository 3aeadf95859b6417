#include "scriptsign/cli/report.hpp"

namespace scriptsign::cli {

void print_certificates(std::ostream& out,
                        const std::vector<signing::CertificateDescriptor>& certs) {
    out << "Available code-signing certificates (" << certs.size() << "):\n";
    for (size_t i = 0; i < certs.size(); ++i) {
        const auto& cert = certs[i];
        out << "  [" << (i + 1) << "] " << cert.subject << "\n"
            << "      Thumbprint: " << cert.thumbprint << "\n"
            << "      Expires:    " << (cert.not_after.empty() ? "-" : cert.not_after) << "\n";
    }
}

void print_certificate_choice(std::ostream& out,
                              const signing::CertificateChoiceRequired& choice) {
    print_certificates(out, choice.certificates);
    out << "\nNo certificate was specified, so nothing was signed.\n"
        << "Re-run with --thumbprint <thumbprint> to sign with one of the above,\n"
        << "or with --pfx <file> --pfx-password <password>.\n";
}

void print_signed(std::ostream& out, std::ostream& err,
                  const signing::SignedOutcome& outcome) {
    const auto& sig = outcome.signature;
    out << "Signed: " << outcome.script_path.string() << "\n";
    if (!sig.signed_by.empty()) {
        out << "  Signed by:      " << sig.signed_by << "\n";
    }
    if (sig.time_stamper) {
        out << "  Timestamped by: " << *sig.time_stamper << "\n";
    }
    if (!sig.signature_type.empty()) {
        out << "  Signature type: " << sig.signature_type << "\n";
    }

    if (outcome.verification) {
        out << "  Verification:   " << outcome.verification->status << "\n";
    } else if (outcome.verification_warning) {
        err << "warning: signature was applied but could not be verified: "
            << outcome.verification_warning->what() << "\n";
    }
    out << "Status: " << outcome.final_status() << "\n";
}

void print_verification(std::ostream& out, const std::filesystem::path& script_path,
                        const signing::VerifyData& data) {
    out << "Verified: " << script_path.string() << "\n";
    if (data.signed_by) {
        out << "  Signed by:      " << *data.signed_by << "\n";
    }
    if (data.time_stamper) {
        out << "  Timestamped by: " << *data.time_stamper << "\n";
    }
    out << "Status: " << data.status << "\n";
}

void print_error(std::ostream& err, const Error& error) {
    err << "error: " << error.message() << "\n";
    if (!error.detail().empty()) {
        err << "  " << error.detail() << "\n";
    }
    if (auto hint = remediation_hint(error.code()); !hint.empty()) {
        err << "hint: " << hint << "\n";
    }
}

} // namespace scriptsign::cli
