// Copyright 2025 Vehicle Edge Platform Contributors
// SPDX-License-Identifier: Apache-2.0

#pragma once

/// @file ingest_config.hpp
/// @brief Run configuration for bulk ingestion
///
/// YAML layout:
/// @code
///   input:
///     file: data.lp
///     omit_timestamp: false
///   target:
///     host: http://127.0.0.1:9000
///     backend: questdb
///     timeout_ms: 30000
///     tls_verify: true
///     ca_file: /etc/ssl/certs/ca.pem
///   sending:
///     chunk_size: 1000
///     workers: 4
/// @endcode

#include <chrono>
#include <string>

namespace bulkingest::ingest {

struct IngestConfig {
    // Input
    std::string file;
    bool omit_timestamp = false;

    // Target
    std::string host;
    std::string backend;
    std::chrono::milliseconds request_timeout{30000};
    bool tls_verify = true;
    std::string ca_file;  ///< Empty: system trust store

    // Sending
    int chunk_size = 0;
    int workers = 1;
};

/// Merge values from a YAML file into config; absent keys keep their
/// current value.
/// @throws ConfigurationError if the file cannot be loaded or a value has
///         the wrong type
void load_config_file(const std::string& path, IngestConfig& config);

/// Check a config before any input is read
/// @throws ConfigurationError naming the first invalid setting
void validate_config(const IngestConfig& config);

/// Log the effective configuration
void log_config(const IngestConfig& config);

}  // namespace bulkingest::ingest
