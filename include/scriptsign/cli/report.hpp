#pragma once

#include <filesystem>
#include <ostream>
#include <vector>

#include "scriptsign/core/error.hpp"
#include "scriptsign/signing/orchestrator.hpp"
#include "scriptsign/signing/types.hpp"

namespace scriptsign::cli {

/// Numbered certificate table, in the order given.
void print_certificates(std::ostream& out,
                        const std::vector<signing::CertificateDescriptor>& certs);

/// Listing plus the hint on how to pick one.
void print_certificate_choice(std::ostream& out,
                              const signing::CertificateChoiceRequired& choice);

/// Signing summary to `out`; a verification warning, if any, to `err`.
void print_signed(std::ostream& out, std::ostream& err,
                  const signing::SignedOutcome& outcome);

void print_verification(std::ostream& out, const std::filesystem::path& script_path,
                        const signing::VerifyData& data);

/// Error line, detail and remediation hint when there is one.
void print_error(std::ostream& err, const Error& error);

} // namespace scriptsign::cli
