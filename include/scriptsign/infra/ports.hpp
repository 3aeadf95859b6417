#pragma once

#include <chrono>
#include <cstdint>
#include <functional>
#include <optional>
#include <string>
#include <string_view>

#include "scriptsign/core/config.hpp"

namespace scriptsign::infra {

/// Raw outcome of one connect attempt.
enum class ProbeResult {
    Occupied,  // connect succeeded, something is listening
    Refused,   // connection refused, nothing is listening
    TimedOut,  // no answer within the probe timeout
    Error,     // resolver or socket failure unrelated to the port state
};

/// What the scan does with a probed port.
enum class PortVerdict {
    Free,
    Occupied,
    Skip,
};

auto probe_result_to_string(ProbeResult result) -> std::string_view;

/// Connects to `host:port` and classifies the outcome. The socket is closed
/// before returning. Never blocks longer than `timeout` on the connect.
auto probe_tcp_port(std::string_view host, uint16_t port,
                    std::chrono::milliseconds timeout) -> ProbeResult;

using PortProbe = std::function<ProbeResult(uint16_t port)>;
using ProbePolicy = std::function<PortVerdict(ProbeResult result)>;

/// Default policy: anything that is not a successful connect counts as free.
/// A slow-to-refuse or filtered port is therefore reported as free.
auto timeout_as_free(ProbeResult result) -> PortVerdict;

/// Strict policy: only a refused connect counts as free; timeouts and probe
/// errors skip the port.
auto skip_inconclusive(ProbeResult result) -> PortVerdict;

/// Probes [start_port, end_port] in ascending order and returns the first
/// port the policy calls free. An inverted range scans nothing.
auto find_available_port(uint16_t start_port, uint16_t end_port,
                         const PortProbe& probe,
                         const ProbePolicy& policy = timeout_as_free)
    -> std::optional<uint16_t>;

/// Scans the configured range on the configured host with real TCP probes.
auto find_available_port(const PortScanConfig& config,
                         const ProbePolicy& policy = timeout_as_free)
    -> std::optional<uint16_t>;

} // namespace scriptsign::infra
