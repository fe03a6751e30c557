// Copyright 2025 Vehicle Edge Platform Contributors
// SPDX-License-Identifier: Apache-2.0

#include "bulkingest/report.hpp"

#include <iomanip>

namespace bulkingest::ingest {

void ReportAggregator::add(const SendResult& result) {
    totals_.total_rows += result.rows;
    totals_.total_request_time += result.elapsed;

    if (result.ok()) {
        totals_.chunks_succeeded++;
        totals_.rows_succeeded += result.rows;
    } else {
        totals_.chunks_failed++;
        totals_.rows_failed += result.rows;
    }
}

Report ReportAggregator::finish(std::chrono::nanoseconds wall_time) const {
    Report report = totals_;
    report.wall_time = wall_time;
    return report;
}

void print_report(std::ostream& out, const Report& report) {
    auto seconds = [](std::chrono::nanoseconds ns) {
        return std::chrono::duration<double>(ns).count();
    };

    std::ios_base::fmtflags flags = out.flags();
    std::streamsize precision = out.precision();

    out << std::fixed << std::setprecision(3);
    out << "\nTotal rows ingested: " << report.total_rows << "\n";
    out << "Total request time (sum of all HTTP requests): "
        << seconds(report.total_request_time) << " seconds\n";
    out << "Total wall time for sending requests: " << seconds(report.wall_time)
        << " seconds\n";
    out << "Chunks: " << report.chunks_succeeded << " succeeded, " << report.chunks_failed
        << " failed (" << report.rows_succeeded << " rows confirmed)" << std::endl;

    out.flags(flags);
    out.precision(precision);
}

}  // namespace bulkingest::ingest
