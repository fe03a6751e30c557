// Copyright 2025 Vehicle Edge Platform Contributors
// SPDX-License-Identifier: Apache-2.0

#pragma once

#include <stdexcept>
#include <string>

namespace bulkingest::ingest {

/// Invalid run configuration or unreadable input. Raised before any
/// chunk is sent; terminates the run.
class ConfigurationError : public std::runtime_error {
public:
    explicit ConfigurationError(const std::string& what)
        : std::runtime_error(what) {}
};

}  // namespace bulkingest::ingest
