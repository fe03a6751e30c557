// Copyright 2025 Vehicle Edge Platform Contributors
// SPDX-License-Identifier: Apache-2.0

#pragma once

/// @file chunker.hpp
/// @brief Split a line-oriented input into fixed-size chunks
///
/// Every input line lands in exactly one chunk, in input order. All
/// chunks hold chunk_size lines except the last, which holds the
/// remainder (1..chunk_size). An empty input yields no chunks.
///
/// Example:
/// @code
///   std::ifstream in("data.lp");
///   ChunkReader reader(in, {1000, true}, target);
///   while (auto chunk = reader.next()) {
///       dispatch(*chunk);
///   }
/// @endcode

#include "bulkingest/backend.hpp"

#include <cstddef>
#include <istream>
#include <memory>
#include <optional>
#include <string>
#include <vector>

namespace bulkingest::ingest {

/// A group of consecutive input lines sent as one write request
struct Chunk {
    size_t sequence = 0;  ///< Zero-based position in the file
    std::shared_ptr<const IngestTarget> target;
    std::vector<std::string> lines;

    size_t size() const { return lines.size(); }
};

/// Chunking parameters
struct ChunkerConfig {
    int chunk_size = 0;           ///< Lines per chunk, must be > 0
    bool omit_timestamp = false;  ///< Apply strip_trailing_token to each line
};

/// Reads lines incrementally from a stream and groups them into chunks
class ChunkReader {
public:
    /// @throws ConfigurationError if config.chunk_size <= 0
    ChunkReader(std::istream& in, const ChunkerConfig& config,
                std::shared_ptr<const IngestTarget> target);

    ChunkReader(const ChunkReader&) = delete;
    ChunkReader& operator=(const ChunkReader&) = delete;

    /// Read the next chunk
    /// @return Chunk, or nullopt once the input is exhausted
    /// @throws ConfigurationError on a stream read error
    std::optional<Chunk> next();

    /// Lines consumed so far
    size_t lines_read() const { return lines_read_; }

private:
    std::istream& in_;
    ChunkerConfig config_;
    std::shared_ptr<const IngestTarget> target_;
    size_t next_sequence_ = 0;
    size_t lines_read_ = 0;
};

/// Read a whole file into chunks
/// @throws ConfigurationError if the file cannot be opened or read, or
///         if config.chunk_size <= 0
std::vector<Chunk> read_chunks(const std::string& path, const ChunkerConfig& config,
                               std::shared_ptr<const IngestTarget> target);

}  // namespace bulkingest::ingest
