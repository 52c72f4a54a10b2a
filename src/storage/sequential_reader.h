/*
 * SPDX-License-Identifier: AGPL-3.0-or-later
 *
 * The Lucenia project is free software: you can redistribute it
 * and/or modify it under the terms of the GNU Affero General
 * Public License as published by the Free Software Foundation,
 * either version 3 of the License, or (at your option) any later
 * version.
 *
 * This program is distributed in the hope that it will be useful,
 * but WITHOUT ANY WARRANTY; without even the implied warranty of
 * MERCHANTABILITY or FITNESS FOR A PARTICULAR PURPOSE. See the
 * GNU Affero General Public License for more details.
 *
 * You should have received a copy of the GNU Affero General Public
 * License along with this program. If not, see:
 * https://www.gnu.org/licenses/agpl-3.0.html
 */

#pragma once
#include <cstdint>
#include <memory>
#include <stdexcept>
#include <string>
#include "checkpoint.h"
#include "chunk.h"
#include "metrics.h"
#include "storage_config.h"

namespace chunklog {
namespace storage {

// A chunk kept reporting BeingDeleted past the retry bound. Chunks backing
// data below the durable boundary must not be reclaimed, so this is fatal.
class ChunkRetriesExhausted : public std::runtime_error {
public:
    explicit ChunkRetriesExhausted(const std::string& what) : std::runtime_error(what) {}
};

// Caller asked for something that is never valid, e.g. reading backward
// from beyond the durable boundary.
class InvalidReadRequest : public std::logic_error {
public:
    explicit InvalidReadRequest(const std::string& what) : std::logic_error(what) {}
};

/**
 * SequentialReader - cursor over the chunked log.
 *
 * Reads never go past the writer checkpoint's durable position. Forward
 * traversal yields strictly increasing positions and crosses chunk
 * boundaries transparently; backward traversal yields strictly decreasing
 * ones.
 *
 * Not thread-safe: one consumer drives one reader. Independent readers may
 * share the chunk manager and checkpoint.
 *
 * There is no cancellation; an operation stuck on a chunk under deletion
 * gives up with ChunkRetriesExhausted after max_read_retries retries.
 */
class SequentialReader {
public:
    SequentialReader(const ChunkManager& chunks,
                     const Checkpoint& writer_checkpoint,
                     int64_t initial_position = 0,
                     const StorageConfig& config = StorageConfig::defaults(),
                     ReadStats* stats = nullptr);

    SequentialReader(const SequentialReader&) = delete;
    SequentialReader& operator=(const SequentialReader&) = delete;

    int64_t current_position() const { return current_position_; }

    // Move the cursor; no validation
    void reposition(int64_t position) { current_position_ = position; }

    // Next record at or after the cursor, failure once the durable boundary is reached
    SeqReadResult try_read_next();

    // Record ending at or before the cursor, failure at the start of the log
    SeqReadResult try_read_prev();

    // Record covering position; does not move the cursor
    RecordReadResult try_read_at(int64_t position);

    bool exists_at(int64_t position);

    const ReadStats& stats() const { return *stats_; }
    int max_retries() const { return max_retries_; }

private:
    SeqReadResult make_result(const RecordReadResult& result,
                              const ChunkHeader& header,
                              int64_t writer_chk);

    // Records one BeingDeleted answer; throws once the bound is exceeded
    void on_chunk_being_deleted(int* retries, const char* op, int64_t position);

    const ChunkManager& chunks_;
    const Checkpoint& writer_checkpoint_;
    const int max_retries_;

    std::unique_ptr<ReadStats> owned_stats_;
    ReadStats* stats_;

    int64_t current_position_;
};

} // namespace storage
} // namespace chunklog
