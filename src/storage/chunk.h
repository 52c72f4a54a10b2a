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
#include <vector>
#include "config.h"

namespace chunklog {
namespace storage {

// One appended log entry
struct LogRecord {
    int64_t log_position = 0;          // Absolute position of the record's first framing byte
    std::vector<uint8_t> data;         // Opaque payload

    LogRecord() = default;
    LogRecord(int64_t pos, std::vector<uint8_t> bytes)
        : log_position(pos), data(std::move(bytes)) {}
};

// Outcome of a single chunk-local read
struct RecordReadResult {
    bool success = false;
    int64_t next_position = -1;        // Chunk-local offset the cursor moves to
    std::shared_ptr<const LogRecord> record;
    int32_t record_length = 0;         // Encoded length, framing excluded

    static RecordReadResult failure() { return RecordReadResult{}; }

    static RecordReadResult ok(std::shared_ptr<const LogRecord> rec,
                               int32_t length, int64_t next) {
        RecordReadResult r;
        r.success = true;
        r.next_position = next;
        r.record = std::move(rec);
        r.record_length = length;
        return r;
    }
};

// Outcome of one traversal step of a SequentialReader
struct SeqReadResult {
    bool success = false;
    bool eof = false;                  // record_post_position hit the durable boundary
    std::shared_ptr<const LogRecord> record;
    int32_t record_length = 0;
    int64_t record_pre_position = -1;  // Absolute start of the record
    int64_t record_post_position = -1; // Absolute position right after the record

    static SeqReadResult failure() { return SeqReadResult{}; }
};

// Absolute end of a record given its start and encoded length
inline int64_t record_post_position(int64_t log_position, int32_t record_length) {
    return log_position + record_length + record::kFramingOverhead;
}

/**
 * Chunk header: maps the chunk's slice of the global address space.
 * A chunk spans chunk numbers [chunk_start_number, chunk_end_number]
 * (more than one after scavenging merged neighbours), each
 * chunk_data_size bytes wide.
 */
class ChunkHeader {
public:
    ChunkHeader(int32_t chunk_start_number, int32_t chunk_end_number, int64_t chunk_data_size)
        : chunk_start_number_(chunk_start_number),
          chunk_end_number_(chunk_end_number),
          chunk_data_size_(chunk_data_size) {
        if (chunk_start_number < 0 || chunk_end_number < chunk_start_number) {
            throw std::invalid_argument("ChunkHeader: invalid chunk number range " +
                                        std::to_string(chunk_start_number) + "-" +
                                        std::to_string(chunk_end_number));
        }
        if (chunk_data_size <= 0) {
            throw std::invalid_argument("ChunkHeader: chunk_data_size must be positive");
        }
    }

    int32_t chunk_start_number() const { return chunk_start_number_; }
    int32_t chunk_end_number() const { return chunk_end_number_; }
    int64_t chunk_data_size() const { return chunk_data_size_; }

    int64_t data_start_position() const {
        return static_cast<int64_t>(chunk_start_number_) * chunk_data_size_;
    }

    int64_t data_end_position() const {
        return static_cast<int64_t>(chunk_end_number_ + 1) * chunk_data_size_;
    }

    int64_t data_capacity() const {
        return data_end_position() - data_start_position();
    }

    bool contains(int64_t global_position) const {
        return global_position >= data_start_position() && global_position < data_end_position();
    }

    // Translate an absolute log position into an offset inside this chunk
    int64_t local_data_position(int64_t global_position) const {
        if (!contains(global_position)) {
            throw std::out_of_range("Position " + std::to_string(global_position) +
                                    " is outside chunk data range [" +
                                    std::to_string(data_start_position()) + ", " +
                                    std::to_string(data_end_position()) + ")");
        }
        return global_position - data_start_position();
    }

private:
    int32_t chunk_start_number_;
    int32_t chunk_end_number_;
    int64_t chunk_data_size_;
};

// Result of touching a chunk. BeingDeleted means the chunk is being
// reclaimed concurrently and the caller should resolve it again.
enum class ChunkAccess : uint8_t {
    Ok = 0,
    BeingDeleted = 1
};

/**
 * Chunk - a physically bounded segment of the log.
 *
 * All offsets are chunk-local. Forward and positional reads report as
 * next_position the offset right after the record; backward reads and
 * try_read_last() report the offset of the record's start.
 * Any read may return ChunkAccess::BeingDeleted instead of a result, in
 * which case *out is left untouched.
 */
class Chunk {
public:
    virtual ~Chunk() = default;

    virtual const ChunkHeader& header() const = 0;

    // Whether the chunk's data is memory-resident
    virtual bool is_cached() const = 0;

    virtual ChunkAccess try_read_closest_forward(int64_t local_position, RecordReadResult* out) const = 0;
    virtual ChunkAccess try_read_closest_backward(int64_t local_position, RecordReadResult* out) const = 0;
    virtual ChunkAccess try_read_last(RecordReadResult* out) const = 0;
    virtual ChunkAccess try_read_at(int64_t local_position, RecordReadResult* out) const = 0;
    virtual ChunkAccess exists_at(int64_t local_position, bool* out) const = 0;
};

/**
 * Resolves a logical position to the chunk currently covering it.
 * Safe for concurrent callers; a returned chunk may later be reclaimed,
 * the shared_ptr only keeps the object itself alive.
 */
class ChunkManager {
public:
    virtual ~ChunkManager() = default;
    virtual std::shared_ptr<Chunk> get_chunk_for(int64_t log_position) const = 0;
};

} // namespace storage
} // namespace chunklog
