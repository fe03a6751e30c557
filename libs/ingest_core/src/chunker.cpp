// Copyright 2025 Vehicle Edge Platform Contributors
// SPDX-License-Identifier: Apache-2.0

#include "bulkingest/chunker.hpp"
#include "bulkingest/ingest_errors.hpp"
#include "bulkingest/line_transform.hpp"

#include <glog/logging.h>

#include <cerrno>
#include <cstring>
#include <fstream>

namespace bulkingest::ingest {

ChunkReader::ChunkReader(std::istream& in, const ChunkerConfig& config,
                         std::shared_ptr<const IngestTarget> target)
    : in_(in)
    , config_(config)
    , target_(std::move(target)) {
    if (config_.chunk_size <= 0) {
        throw ConfigurationError("Chunk size must be positive, got " +
                                 std::to_string(config_.chunk_size));
    }
}

std::optional<Chunk> ChunkReader::next() {
    Chunk chunk;
    chunk.target = target_;
    chunk.lines.reserve(static_cast<size_t>(config_.chunk_size));

    std::string line;
    while (chunk.lines.size() < static_cast<size_t>(config_.chunk_size) &&
           std::getline(in_, line)) {
        // Text-mode newline handling: drop the CR of a CRLF terminator
        if (!line.empty() && line.back() == '\r') {
            line.pop_back();
        }
        if (config_.omit_timestamp) {
            line = strip_trailing_token(line);
        }
        chunk.lines.push_back(std::move(line));
        lines_read_++;
    }

    if (in_.bad()) {
        throw ConfigurationError("Error reading input after " + std::to_string(lines_read_) +
                                 " lines");
    }

    if (chunk.lines.empty()) {
        return std::nullopt;
    }

    chunk.sequence = next_sequence_++;
    return chunk;
}

std::vector<Chunk> read_chunks(const std::string& path, const ChunkerConfig& config,
                               std::shared_ptr<const IngestTarget> target) {
    std::ifstream file(path, std::ios::in | std::ios::binary);
    if (!file.is_open()) {
        throw ConfigurationError("Error reading file " + path + ": " + std::strerror(errno));
    }

    ChunkReader reader(file, config, std::move(target));
    std::vector<Chunk> chunks;
    while (auto chunk = reader.next()) {
        chunks.push_back(std::move(*chunk));
    }

    LOG(INFO) << "Read " << reader.lines_read() << " lines from " << path << " into "
              << chunks.size() << " chunks of up to " << config.chunk_size << " lines";
    return chunks;
}

}  // namespace bulkingest::ingest
