// Copyright 2025 Vehicle Edge Platform Contributors
// SPDX-License-Identifier: Apache-2.0

#pragma once

/// @file report.hpp
/// @brief Aggregation of chunk send results into a run summary

#include "bulkingest/chunk_sender.hpp"

#include <chrono>
#include <cstdint>
#include <ostream>

namespace bulkingest::ingest {

/// Summary of one ingestion run
struct Report {
    /// Rows attempted, failed chunks included
    uint64_t total_rows = 0;
    /// Sum of per-request durations; exceeds wall_time under concurrency
    std::chrono::nanoseconds total_request_time{0};
    /// Elapsed time of the whole dispatch phase
    std::chrono::nanoseconds wall_time{0};

    uint64_t chunks_succeeded = 0;
    uint64_t chunks_failed = 0;
    uint64_t rows_succeeded = 0;
    uint64_t rows_failed = 0;

    uint64_t chunks() const { return chunks_succeeded + chunks_failed; }
};

/// Accumulates SendResults in any order
class ReportAggregator {
public:
    void add(const SendResult& result);

    /// Build the final report
    /// @param wall_time Measured by the caller around the dispatch phase
    Report finish(std::chrono::nanoseconds wall_time) const;

private:
    Report totals_;
};

/// Print the operator summary
void print_report(std::ostream& out, const Report& report);

}  // namespace bulkingest::ingest
