// Copyright 2025 Vehicle Edge Platform Contributors
// SPDX-License-Identifier: Apache-2.0
//
// bulk_ingest - parallel line protocol loader
//
// Reads a line protocol file, splits it into chunks of --chunk_size lines
// and POSTs each chunk to a QuestDB or InfluxDB write endpoint using
// --workers concurrent requests.
//
// Usage:
//   bulk_ingest --host http://127.0.0.1:9000 --file data.lp \
//               --backend questdb --chunk_size 10000 --workers 4

#include "bulkingest/http_ingest_transport.hpp"
#include "bulkingest/ingest_config.hpp"
#include "bulkingest/ingest_errors.hpp"
#include "bulkingest/ingest_pipeline.hpp"

#include <gflags/gflags.h>
#include <glog/logging.h>

#include <chrono>
#include <iostream>
#include <memory>

DEFINE_string(config, "", "Optional YAML configuration file; explicit flags take precedence");
DEFINE_string(host, "", "Host URL (e.g., http://127.0.0.1:9000 or https://db:9000)");
DEFINE_string(file, "", "Path to the input data file");
DEFINE_string(backend, "", "Target backend: questdb or influxdb");
DEFINE_int32(chunk_size, 0, "Number of lines per chunk");
DEFINE_int32(workers, 1, "Number of parallel workers");
DEFINE_bool(omit_timestamp, false,
            "Remove the timestamp (last token) from each row before sending");
DEFINE_int32(timeout_ms, 30000, "Per-request timeout in milliseconds");
DEFINE_bool(tls_verify, true, "Verify the server certificate for https hosts");
DEFINE_string(ca_file, "", "PEM CA bundle for https hosts (default: system store)");

namespace {

bool flag_set(const char* name) {
    return !gflags::GetCommandLineFlagInfoOrDie(name).is_default;
}

bulkingest::ingest::IngestConfig build_config() {
    bulkingest::ingest::IngestConfig config;
    config.workers = FLAGS_workers;
    config.request_timeout = std::chrono::milliseconds(FLAGS_timeout_ms);

    if (!FLAGS_config.empty()) {
        bulkingest::ingest::load_config_file(FLAGS_config, config);
    }

    if (flag_set("host")) config.host = FLAGS_host;
    if (flag_set("file")) config.file = FLAGS_file;
    if (flag_set("backend")) config.backend = FLAGS_backend;
    if (flag_set("chunk_size")) config.chunk_size = FLAGS_chunk_size;
    if (flag_set("workers")) config.workers = FLAGS_workers;
    if (flag_set("omit_timestamp")) config.omit_timestamp = FLAGS_omit_timestamp;
    if (flag_set("timeout_ms")) {
        config.request_timeout = std::chrono::milliseconds(FLAGS_timeout_ms);
    }
    if (flag_set("tls_verify")) config.tls_verify = FLAGS_tls_verify;
    if (flag_set("ca_file")) config.ca_file = FLAGS_ca_file;

    return config;
}

}  // namespace

int main(int argc, char* argv[]) {
    // Initialize logging
    google::InitGoogleLogging(argv[0]);
    FLAGS_logtostderr = true;
    FLAGS_colorlogtostderr = true;

    // Parse command line flags
    gflags::SetUsageMessage(
        "Send file data in parallel chunks (number of lines) to QuestDB or InfluxDB\n\n"
        "Example:\n"
        "  bulk_ingest --host http://127.0.0.1:9000 --file data.lp \\\n"
        "              --backend questdb --chunk_size 10000 --workers 4");
    gflags::ParseCommandLineFlags(&argc, &argv, true);

    bulkingest::ingest::IngestConfig config;
    try {
        config = build_config();
    } catch (const bulkingest::ingest::ConfigurationError& e) {
        LOG(ERROR) << e.what();
        gflags::ShutDownCommandLineFlags();
        return 1;
    }

    int status = bulkingest::ingest::run_ingest(
        config,
        [](const bulkingest::ingest::IngestConfig& c) {
            bulkingest::HttpIngestTransportConfig transport_config;
            transport_config.timeout = c.request_timeout;
            transport_config.verify_peer = c.tls_verify;
            transport_config.ca_file = c.ca_file;
            return std::make_unique<bulkingest::HttpIngestTransport>(transport_config);
        },
        std::cout);

    gflags::ShutDownCommandLineFlags();
    return status;
}
