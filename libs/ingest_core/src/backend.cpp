// Copyright 2025 Vehicle Edge Platform Contributors
// SPDX-License-Identifier: Apache-2.0

#include "bulkingest/backend.hpp"
#include "bulkingest/http_ingest_transport.hpp"
#include "bulkingest/ingest_errors.hpp"

#include <algorithm>
#include <cctype>

namespace bulkingest::ingest {

const char* to_string(BackendKind kind) {
    switch (kind) {
        case BackendKind::QUESTDB: return "questdb";
        case BackendKind::INFLUXDB: return "influxdb";
    }
    return "unknown";
}

std::optional<BackendKind> backend_kind_from_string(const std::string& name) {
    std::string lower = name;
    std::transform(lower.begin(), lower.end(), lower.begin(),
                   [](unsigned char c) { return std::tolower(c); });

    if (lower == "questdb") {
        return BackendKind::QUESTDB;
    } else if (lower == "influxdb") {
        return BackendKind::INFLUXDB;
    }

    return std::nullopt;
}

std::string resolve_endpoint(const std::string& host, BackendKind kind) {
    std::string base = host;
    while (!base.empty() && base.back() == '/') {
        base.pop_back();
    }

    switch (kind) {
        case BackendKind::QUESTDB:
            return base + "/write";
        case BackendKind::INFLUXDB:
            return base + "/api/v3/write_lp?db=sensors&precision=auto";
    }
    throw ConfigurationError("Unsupported backend");
}

std::shared_ptr<const IngestTarget> make_target(const std::string& host,
                                                const std::string& backend_name) {
    auto kind = backend_kind_from_string(backend_name);
    if (!kind) {
        throw ConfigurationError("Unsupported backend: " + backend_name);
    }

    auto target = std::make_shared<IngestTarget>();
    target->host = host;
    target->backend = *kind;
    target->endpoint_url = resolve_endpoint(host, *kind);
    if (!parse_http_url(target->endpoint_url)) {
        throw ConfigurationError("Unsupported target host: '" + host +
                                 "' (expected an http:// or https:// URL)");
    }
    return target;
}

}  // namespace bulkingest::ingest
