// Copyright 2025 Vehicle Edge Platform Contributors
// SPDX-License-Identifier: Apache-2.0

#pragma once

/// @file http_ingest_transport.hpp
/// @brief HTTP/1.1 write transport implementation
///
/// HttpIngestTransport implements IngestTransport with Boost.Beast:
/// - one io_context and stream per request (no shared session state)
/// - https:// endpoints go through an OpenSSL stream with SNI and
///   host name verification
/// - Connection: close, Content-Length framed body
/// - one deadline per request, starting before name resolution

#include "bulkingest/ingest_transport.hpp"

#include <boost/asio/ssl/context.hpp>

#include <chrono>
#include <mutex>
#include <optional>
#include <string>

namespace bulkingest {

/// Configuration for the HTTP transport
struct HttpIngestTransportConfig {
    std::chrono::milliseconds timeout{30000};
    std::string content_type = "text/plain; charset=utf-8";
    std::string user_agent = "bulk_ingest";
    bool verify_peer = true;   ///< Verify the server certificate for https
    std::string ca_file;       ///< PEM bundle; system default paths when empty
};

/// Components of an http:// or https:// URL
struct HttpUrl {
    bool tls = false;     ///< true for https
    std::string host;     ///< Host name or address, no brackets
    std::string port;     ///< Defaults to "80", or "443" for https
    std::string target;   ///< Path plus query, at least "/"
    std::string host_header;  ///< Value for the Host header
};

/// Split an http:// or https:// URL into host, port and request target
/// @return HttpUrl if the URL is valid, nullopt otherwise
std::optional<HttpUrl> parse_http_url(const std::string& url);

/// HTTP POST transport
class HttpIngestTransport : public IngestTransport {
public:
    /// @throws TransportError if the TLS context cannot be set up
    explicit HttpIngestTransport(const HttpIngestTransportConfig& config = {});
    ~HttpIngestTransport() override = default;

    HttpIngestTransport(const HttpIngestTransport&) = delete;
    HttpIngestTransport& operator=(const HttpIngestTransport&) = delete;

    TransportResponse post(const std::string& url, const std::string& body) override;
    TransportStats stats() const override;
    std::string name() const override { return "http"; }

private:
    void record_failure();

    HttpIngestTransportConfig config_;
    boost::asio::ssl::context ssl_ctx_;

    mutable std::mutex stats_mutex_;
    TransportStats stats_;
};

}  // namespace bulkingest
