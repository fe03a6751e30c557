// Copyright 2025 Vehicle Edge Platform Contributors
// SPDX-License-Identifier: Apache-2.0

#include "bulkingest/ingest_config.hpp"
#include "bulkingest/backend.hpp"
#include "bulkingest/http_ingest_transport.hpp"
#include "bulkingest/ingest_errors.hpp"

#include <glog/logging.h>
#include <yaml-cpp/yaml.h>

namespace bulkingest::ingest {

void load_config_file(const std::string& path, IngestConfig& config) {
    try {
        YAML::Node yaml = YAML::LoadFile(path);

        if (yaml["input"]) {
            auto input = yaml["input"];
            if (input["file"]) config.file = input["file"].as<std::string>();
            if (input["omit_timestamp"]) config.omit_timestamp = input["omit_timestamp"].as<bool>();
        }

        if (yaml["target"]) {
            auto target = yaml["target"];
            if (target["host"]) config.host = target["host"].as<std::string>();
            if (target["backend"]) config.backend = target["backend"].as<std::string>();
            if (target["timeout_ms"]) {
                config.request_timeout = std::chrono::milliseconds(target["timeout_ms"].as<int>());
            }
            if (target["tls_verify"]) config.tls_verify = target["tls_verify"].as<bool>();
            if (target["ca_file"]) config.ca_file = target["ca_file"].as<std::string>();
        }

        if (yaml["sending"]) {
            auto sending = yaml["sending"];
            if (sending["chunk_size"]) config.chunk_size = sending["chunk_size"].as<int>();
            if (sending["workers"]) config.workers = sending["workers"].as<int>();
        }

        LOG(INFO) << "Loaded configuration from " << path;
    } catch (const YAML::Exception& e) {
        throw ConfigurationError("Failed to load config file " + path + ": " + e.what());
    }
}

void validate_config(const IngestConfig& config) {
    if (config.file.empty()) {
        throw ConfigurationError("Missing input file");
    }
    if (config.host.empty()) {
        throw ConfigurationError("Missing target host");
    }
    auto kind = backend_kind_from_string(config.backend);
    if (!kind) {
        throw ConfigurationError("Unsupported backend: '" + config.backend +
                                 "' (expected questdb or influxdb)");
    }
    if (!parse_http_url(resolve_endpoint(config.host, *kind))) {
        throw ConfigurationError("Unsupported target host: '" + config.host +
                                 "' (expected an http:// or https:// URL)");
    }
    if (config.chunk_size <= 0) {
        throw ConfigurationError("Chunk size must be positive, got " +
                                 std::to_string(config.chunk_size));
    }
    if (config.workers <= 0) {
        throw ConfigurationError("Worker count must be positive, got " +
                                 std::to_string(config.workers));
    }
    if (config.request_timeout.count() <= 0) {
        throw ConfigurationError("Request timeout must be positive, got " +
                                 std::to_string(config.request_timeout.count()) + "ms");
    }
}

void log_config(const IngestConfig& config) {
    LOG(INFO) << "=== Bulk Ingest Configuration ===";
    LOG(INFO) << "Input file: " << config.file
              << (config.omit_timestamp ? " (timestamps omitted)" : "");
    LOG(INFO) << "Target: " << config.host << " (" << config.backend << ")";
    LOG(INFO) << "Chunk size: " << config.chunk_size << " lines";
    LOG(INFO) << "Workers: " << config.workers;
    LOG(INFO) << "Request timeout: " << config.request_timeout.count() << "ms";
    LOG(INFO) << "TLS verify: " << (config.tls_verify ? "on" : "off")
              << (config.ca_file.empty() ? "" : " (CA file " + config.ca_file + ")");
}

}  // namespace bulkingest::ingest
