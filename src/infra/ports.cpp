#include "scriptsign/infra/ports.hpp"
#include "scriptsign/core/logger.hpp"

#include <boost/asio/connect.hpp>
#include <boost/asio/io_context.hpp>
#include <boost/asio/ip/tcp.hpp>

namespace scriptsign::infra {

namespace {

using boost::asio::ip::tcp;

} // anonymous namespace

auto probe_result_to_string(ProbeResult result) -> std::string_view {
    switch (result) {
        case ProbeResult::Occupied: return "occupied";
        case ProbeResult::Refused: return "refused";
        case ProbeResult::TimedOut: return "timed out";
        case ProbeResult::Error: return "error";
        default: return "unknown";
    }
}

auto probe_tcp_port(std::string_view host, uint16_t port,
                    std::chrono::milliseconds timeout) -> ProbeResult {
    boost::asio::io_context ioc;
    boost::system::error_code ec;

    tcp::resolver resolver(ioc);
    auto endpoints = resolver.resolve(std::string(host), std::to_string(port), ec);
    if (ec) {
        LOG_DEBUG("Probe {}:{} resolve failed: {}", host, port, ec.message());
        return ProbeResult::Error;
    }

    tcp::socket socket(ioc);
    std::optional<boost::system::error_code> connect_ec;
    boost::asio::async_connect(
        socket, endpoints,
        [&connect_ec](const boost::system::error_code& e, const tcp::endpoint&) {
            connect_ec = e;
        });

    ioc.run_for(timeout);

    if (!connect_ec) {
        // Still pending: abandon the attempt. Closing the socket cancels the
        // outstanding operation; its handler is discarded with the context.
        socket.close(ec);
        return ProbeResult::TimedOut;
    }

    if (!*connect_ec) {
        socket.shutdown(tcp::socket::shutdown_both, ec);
        socket.close(ec);
        return ProbeResult::Occupied;
    }

    if (*connect_ec == boost::asio::error::connection_refused) {
        return ProbeResult::Refused;
    }

    LOG_DEBUG("Probe {}:{} failed: {}", host, port, connect_ec->message());
    return ProbeResult::Error;
}

auto timeout_as_free(ProbeResult result) -> PortVerdict {
    return result == ProbeResult::Occupied ? PortVerdict::Occupied : PortVerdict::Free;
}

auto skip_inconclusive(ProbeResult result) -> PortVerdict {
    switch (result) {
        case ProbeResult::Occupied: return PortVerdict::Occupied;
        case ProbeResult::Refused: return PortVerdict::Free;
        default: return PortVerdict::Skip;
    }
}

auto find_available_port(uint16_t start_port, uint16_t end_port,
                         const PortProbe& probe, const ProbePolicy& policy)
    -> std::optional<uint16_t> {
    // Widened cursor so end_port == 65535 terminates.
    for (uint32_t candidate = start_port; candidate <= end_port; ++candidate) {
        auto port = static_cast<uint16_t>(candidate);
        auto result = probe(port);
        auto verdict = policy(result);
        LOG_TRACE("Port {}: {}", port, probe_result_to_string(result));

        if (verdict == PortVerdict::Free) {
            LOG_DEBUG("Found free port: {}", port);
            return port;
        }
        if (verdict == PortVerdict::Skip) {
            LOG_DEBUG("Skipping port {} (probe {})", port, probe_result_to_string(result));
        }
    }
    LOG_WARN("No free port found in range [{}, {}]", start_port, end_port);
    return std::nullopt;
}

auto find_available_port(const PortScanConfig& config, const ProbePolicy& policy)
    -> std::optional<uint16_t> {
    const auto in_range = [](int port) { return port >= 1 && port <= 65535; };
    if (!in_range(config.start_port) || !in_range(config.end_port)) {
        LOG_WARN("Port range [{}, {}] is outside 1-65535", config.start_port, config.end_port);
        return std::nullopt;
    }
    const auto timeout = std::chrono::milliseconds(config.probe_timeout_ms);
    auto probe = [&config, timeout](uint16_t port) {
        return probe_tcp_port(config.host, port, timeout);
    };
    return find_available_port(static_cast<uint16_t>(config.start_port),
                               static_cast<uint16_t>(config.end_port), probe, policy);
}

} // namespace scriptsign::infra
