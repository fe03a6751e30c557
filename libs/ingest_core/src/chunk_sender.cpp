// Copyright 2025 Vehicle Edge Platform Contributors
// SPDX-License-Identifier: Apache-2.0

#include "bulkingest/chunk_sender.hpp"

#include <glog/logging.h>

#include <iomanip>
#include <sstream>

namespace bulkingest::ingest {

namespace {

std::string format_seconds(std::chrono::nanoseconds elapsed) {
    std::ostringstream out;
    out << std::fixed << std::setprecision(3)
        << std::chrono::duration<double>(elapsed).count();
    return out.str();
}

}  // namespace

const char* to_string(SendStatus status) {
    switch (status) {
        case SendStatus::OK: return "ok";
        case SendStatus::APPLICATION_ERROR: return "application_error";
        case SendStatus::TRANSPORT_ERROR: return "transport_error";
    }
    return "unknown";
}

std::string serialize_chunk(const Chunk& chunk) {
    size_t total = 0;
    for (const auto& line : chunk.lines) {
        total += line.size() + 1;
    }

    std::string body;
    body.reserve(total);
    for (const auto& line : chunk.lines) {
        body += line;
        body += '\n';
    }
    return body;
}

ChunkSender::ChunkSender(IngestTransport& transport, std::ostream& progress)
    : transport_(transport)
    , progress_(progress) {
}

SendResult ChunkSender::send(const Chunk& chunk) {
    SendResult result;
    result.sequence = chunk.sequence;
    result.rows = chunk.size();

    const std::string body = serialize_chunk(chunk);
    const std::string& url = chunk.target->endpoint_url;

    auto start = std::chrono::steady_clock::now();
    try {
        TransportResponse response = transport_.post(url, body);
        result.elapsed = std::chrono::steady_clock::now() - start;
        result.http_status = response.status_code;

        report_progress("Sent chunk (" + std::to_string(chunk.size()) + " lines) -> HTTP " +
                        std::to_string(response.status_code) + " in " +
                        format_seconds(result.elapsed) + " seconds");

        if (!response.ok()) {
            result.status = SendStatus::APPLICATION_ERROR;
            result.error = response.body;
            LOG(ERROR) << "Chunk " << chunk.sequence << " rejected with HTTP "
                       << response.status_code << ": " << response.body;
        }
    } catch (const std::exception& e) {
        result.elapsed = std::chrono::steady_clock::now() - start;
        result.status = SendStatus::TRANSPORT_ERROR;
        result.error = e.what();

        report_progress("Exception while sending chunk (" + std::to_string(chunk.size()) +
                        " lines): " + e.what() + " (took " + format_seconds(result.elapsed) +
                        " seconds)");
        LOG(WARNING) << "Chunk " << chunk.sequence << " failed: " << e.what();
    }

    VLOG(1) << "Chunk " << chunk.sequence << " (" << body.size() << " bytes) -> "
            << to_string(result.status);
    return result;
}

void ChunkSender::report_progress(const std::string& line) {
    std::lock_guard<std::mutex> lock(progress_mutex_);
    progress_ << line << std::endl;
}

}  // namespace bulkingest::ingest
