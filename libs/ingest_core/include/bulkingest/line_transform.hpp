// Copyright 2025 Vehicle Edge Platform Contributors
// SPDX-License-Identifier: Apache-2.0

#pragma once

#include <string>

namespace bulkingest::ingest {

/// Remove the last whitespace-delimited token (the line protocol
/// timestamp) together with the single space or tab before it.
/// Lines without a space or tab are returned unchanged.
///
/// Applied once; "a b c 123" -> "a b c", "a b " -> "a b".
std::string strip_trailing_token(const std::string& line);

}  // namespace bulkingest::ingest
