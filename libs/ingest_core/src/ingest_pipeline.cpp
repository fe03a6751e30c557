// Copyright 2025 Vehicle Edge Platform Contributors
// SPDX-License-Identifier: Apache-2.0

#include "bulkingest/ingest_pipeline.hpp"
#include "bulkingest/backend.hpp"
#include "bulkingest/chunk_sender.hpp"
#include "bulkingest/chunker.hpp"
#include "bulkingest/ingest_errors.hpp"
#include "bulkingest/worker_pool.hpp"

#include <glog/logging.h>

#include <chrono>

namespace bulkingest::ingest {

IngestPipeline::IngestPipeline(std::unique_ptr<IngestTransport> transport,
                               const IngestConfig& config)
    : config_(config)
    , transport_(std::move(transport)) {
}

Report IngestPipeline::run(std::ostream& out) {
    validate_config(config_);
    auto target = make_target(config_.host, config_.backend);

    LOG(INFO) << "Ingesting " << config_.file << " into " << to_string(target->backend)
              << " at " << target->endpoint_url << " via " << transport_->name() << " transport";

    out << "\nDividing the file in chunks. This will take a few seconds\n" << std::endl;

    ChunkerConfig chunker_config;
    chunker_config.chunk_size = config_.chunk_size;
    chunker_config.omit_timestamp = config_.omit_timestamp;
    std::vector<Chunk> chunks = read_chunks(config_.file, chunker_config, target);

    ChunkSender sender(*transport_, out);
    ReportAggregator aggregator;

    // Wall clock spans pool creation through the join of every worker
    auto start_wall = std::chrono::steady_clock::now();
    WorkerPool pool(static_cast<size_t>(config_.workers));
    std::vector<SendResult> results =
        pool.run(chunks, [&sender](const Chunk& chunk) { return sender.send(chunk); });
    auto wall_time = std::chrono::steady_clock::now() - start_wall;

    for (const auto& result : results) {
        aggregator.add(result);
    }

    Report report = aggregator.finish(
        std::chrono::duration_cast<std::chrono::nanoseconds>(wall_time));
    print_report(out, report);

    LOG(INFO) << "Ingestion finished. Stats: chunks=" << report.chunks()
              << " failed=" << report.chunks_failed
              << " rows=" << report.total_rows
              << " bytes=" << transport_->stats().bytes_sent;
    return report;
}

int run_ingest(const IngestConfig& config, const TransportFactory& make_transport,
               std::ostream& out) {
    try {
        validate_config(config);
        log_config(config);

        IngestPipeline pipeline(make_transport(config), config);
        pipeline.run(out);
    } catch (const ConfigurationError& e) {
        LOG(ERROR) << e.what();
        return 1;
    } catch (const std::exception& e) {
        LOG(ERROR) << "Ingestion aborted: " << e.what();
        return 2;
    }
    return 0;
}

}  // namespace bulkingest::ingest
