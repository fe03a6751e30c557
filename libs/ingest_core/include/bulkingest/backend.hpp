// Copyright 2025 Vehicle Edge Platform Contributors
// SPDX-License-Identifier: Apache-2.0

#pragma once

/// @file backend.hpp
/// @brief Ingestion backends and their write endpoint conventions
///
/// Each backend accepts line protocol over HTTP POST at a fixed path:
/// - questdb:  {host}/write
/// - influxdb: {host}/api/v3/write_lp?db=sensors&precision=auto

#include <memory>
#include <optional>
#include <string>

namespace bulkingest::ingest {

/// Supported ingestion backends
enum class BackendKind {
    QUESTDB,
    INFLUXDB
};

/// Convert BackendKind to string
/// @return "questdb" or "influxdb"
const char* to_string(BackendKind kind);

/// Parse BackendKind from string
/// @param name Backend name (case-insensitive: "questdb", "InfluxDB", ...)
/// @return BackendKind if valid, nullopt if unknown
std::optional<BackendKind> backend_kind_from_string(const std::string& name);

/// Build the write URL for a backend
/// @param host Base URL, e.g. "http://127.0.0.1:9000"; trailing '/' ignored
std::string resolve_endpoint(const std::string& host, BackendKind kind);

/// Destination shared by every chunk of a run
struct IngestTarget {
    std::string host;
    BackendKind backend;
    std::string endpoint_url;
};

/// Resolve host and backend name into a target
/// @throws ConfigurationError if the backend name is unknown or the
///         resulting endpoint is not an http:// or https:// URL
std::shared_ptr<const IngestTarget> make_target(const std::string& host,
                                                const std::string& backend_name);

}  // namespace bulkingest::ingest
