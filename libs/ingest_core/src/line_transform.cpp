// Copyright 2025 Vehicle Edge Platform Contributors
// SPDX-License-Identifier: Apache-2.0

#include "bulkingest/line_transform.hpp"

namespace bulkingest::ingest {

std::string strip_trailing_token(const std::string& line) {
    size_t split = line.find_last_of(" \t");
    if (split == std::string::npos) {
        return line;
    }
    return line.substr(0, split);
}

}  // namespace bulkingest::ingest
