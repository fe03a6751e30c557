// Copyright 2025 Vehicle Edge Platform Contributors
// SPDX-License-Identifier: Apache-2.0

#pragma once

/// @file ingest_pipeline.hpp
/// @brief File-to-backend bulk ingestion pipeline
///
/// IngestPipeline orchestrates:
/// - Chunking (ChunkReader, optional timestamp stripping)
/// - Dispatch (WorkerPool over ChunkSender)
/// - Transport (IngestTransport interface)
/// - Reporting (ReportAggregator)
///
/// Architecture:
///   file -> read_chunks -> WorkerPool -> ChunkSender -> IngestTransport
///                                            |
///                                      ReportAggregator -> Report

#include "bulkingest/ingest_config.hpp"
#include "bulkingest/ingest_transport.hpp"
#include "bulkingest/report.hpp"

#include <functional>
#include <memory>
#include <ostream>

namespace bulkingest::ingest {

class IngestPipeline {
public:
    /// @param transport Write transport (HTTP, or a fake in tests)
    /// @param config Run configuration, validated by run()
    IngestPipeline(std::unique_ptr<IngestTransport> transport, const IngestConfig& config);

    IngestPipeline(const IngestPipeline&) = delete;
    IngestPipeline& operator=(const IngestPipeline&) = delete;

    /// Chunk the input file, send every chunk and print the report.
    /// Per-chunk failures are reflected in the report; they never abort
    /// the run.
    /// @param out Operator stream for progress lines and the summary
    /// @throws ConfigurationError for invalid config or unreadable input,
    ///         before any request is sent
    Report run(std::ostream& out);

    /// Transport statistics
    TransportStats transport_stats() const { return transport_->stats(); }

private:
    IngestConfig config_;
    std::unique_ptr<IngestTransport> transport_;
};

/// Builds the transport for a validated config
using TransportFactory = std::function<std::unique_ptr<IngestTransport>(const IngestConfig&)>;

/// Validate, create the transport and run a pipeline, logging any error.
/// @return Exit status: 0 after a completed run (failed chunks included),
///         1 on ConfigurationError, 2 on any other error
int run_ingest(const IngestConfig& config, const TransportFactory& make_transport,
               std::ostream& out);

}  // namespace bulkingest::ingest
