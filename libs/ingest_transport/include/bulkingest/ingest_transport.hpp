// Copyright 2025 Vehicle Edge Platform Contributors
// SPDX-License-Identifier: Apache-2.0

#pragma once

/// @file ingest_transport.hpp
/// @brief Abstract interface for write-request transports
///
/// IngestTransport decouples the wire mechanism from chunking and
/// dispatch. The transport receives an already-serialized body and a
/// fully resolved endpoint URL, performs exactly one write request and
/// reports the response status and body.
///
/// Implementations:
/// - HttpIngestTransport: HTTP/1.1 POST via Boost.Beast
///
/// Implementations must be safe to call from several worker threads at
/// once.

#include <cstdint>
#include <stdexcept>
#include <string>

namespace bulkingest {

/// Raised when a request could not be completed at the network level
/// (resolve, connect, write, read or timeout). A response with a
/// non-success status is NOT a TransportError.
class TransportError : public std::runtime_error {
public:
    explicit TransportError(const std::string& what)
        : std::runtime_error(what) {}
};

/// Response of a completed write request
struct TransportResponse {
    int status_code = 0;
    std::string body;

    /// 2xx status
    bool ok() const { return status_code >= 200 && status_code < 300; }
};

/// Transport statistics
struct TransportStats {
    uint64_t requests_sent = 0;
    uint64_t requests_failed = 0;
    uint64_t bytes_sent = 0;
    int64_t last_send_timestamp_ns = 0;
};

/// Abstract interface for write transports.
class IngestTransport {
public:
    virtual ~IngestTransport() = default;

    /// Issue one write request
    /// @param url Fully qualified endpoint URL
    /// @param body Request body, sent as-is
    /// @return Response status and body
    /// @throws TransportError if no response could be obtained
    virtual TransportResponse post(const std::string& url, const std::string& body) = 0;

    /// Get statistics
    virtual TransportStats stats() const = 0;

    /// Get transport name for logging
    virtual std::string name() const = 0;
};

}  // namespace bulkingest
