// Copyright 2025 Vehicle Edge Platform Contributors
// SPDX-License-Identifier: Apache-2.0

#pragma once

/// @file chunk_sender.hpp
/// @brief Send one chunk as one write request
///
/// ChunkSender serializes a chunk (lines joined by '\n' plus a trailing
/// '\n'), posts it through the injected IngestTransport and times only
/// the transport call. Failures never escape: every call returns a
/// SendResult and prints one progress line.

#include "bulkingest/chunker.hpp"
#include "bulkingest/ingest_transport.hpp"

#include <chrono>
#include <mutex>
#include <ostream>
#include <string>

namespace bulkingest::ingest {

/// Outcome class of a chunk send
enum class SendStatus {
    OK,                ///< 2xx response
    APPLICATION_ERROR, ///< Response with a non-success status
    TRANSPORT_ERROR    ///< No response (connect, timeout, ...)
};

/// Convert SendStatus to string
const char* to_string(SendStatus status);

/// Result of sending one chunk
struct SendResult {
    size_t sequence = 0;
    size_t rows = 0;                       ///< Lines attempted
    std::chrono::nanoseconds elapsed{0};   ///< Transport call duration
    SendStatus status = SendStatus::OK;
    int http_status = 0;                   ///< 0 when no response was received
    std::string error;                     ///< Error text or response body

    bool ok() const { return status == SendStatus::OK; }
};

/// Wire body of a chunk
std::string serialize_chunk(const Chunk& chunk);

/// Sends chunks through a transport. Safe to share between workers.
class ChunkSender {
public:
    /// @param transport Thread-safe transport, must outlive the sender
    /// @param progress Stream receiving one line per send
    ChunkSender(IngestTransport& transport, std::ostream& progress);

    ChunkSender(const ChunkSender&) = delete;
    ChunkSender& operator=(const ChunkSender&) = delete;

    SendResult send(const Chunk& chunk);

private:
    void report_progress(const std::string& line);

    IngestTransport& transport_;
    std::ostream& progress_;
    std::mutex progress_mutex_;
};

}  // namespace bulkingest::ingest
