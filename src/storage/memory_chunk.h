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
#include <atomic>
#include <cstdint>
#include <memory>
#include <shared_mutex>
#include <vector>
#include "chunk.h"
#include "storage_config.h"

namespace chunklog {
namespace storage {

/**
 * MemoryChunk - heap-backed chunk.
 *
 * Record frame (little-endian):
 *   [len:u32][log_position:u64][payload ...][len:u32]
 * where len covers log_position + payload. Records never cross the
 * chunk's data end; the unused tail is padding.
 *
 * Appends and reads may run concurrently; reads take a shared lock.
 */
class MemoryChunk final : public Chunk {
public:
    explicit MemoryChunk(const ChunkHeader& header, bool cached = true);

    const ChunkHeader& header() const override { return header_; }

    bool is_cached() const override { return cached_.load(std::memory_order_relaxed); }
    void set_cached(bool cached) { cached_.store(cached, std::memory_order_relaxed); }

    // Append a record at the current write offset. Returns false when the
    // framed record does not fit in the remaining space.
    bool try_append(const std::vector<uint8_t>& payload, int64_t* out_log_position);

    // Every read from now on reports ChunkAccess::BeingDeleted
    void mark_for_deletion() { deleting_.store(true, std::memory_order_release); }
    bool is_being_deleted() const { return deleting_.load(std::memory_order_acquire); }

    int64_t local_write_position() const;
    size_t record_count() const;

    ChunkAccess try_read_closest_forward(int64_t local_position, RecordReadResult* out) const override;
    ChunkAccess try_read_closest_backward(int64_t local_position, RecordReadResult* out) const override;
    ChunkAccess try_read_last(RecordReadResult* out) const override;
    ChunkAccess try_read_at(int64_t local_position, RecordReadResult* out) const override;
    ChunkAccess exists_at(int64_t local_position, bool* out) const override;

    // Encoded size of a payload once framed
    static int64_t framed_size(size_t payload_size) {
        return static_cast<int64_t>(record::kPositionFieldSize + payload_size) + record::kFramingOverhead;
    }

private:
    // Caller holds mu_ (shared). idx indexes record_offsets_.
    RecordReadResult read_record(size_t idx, bool next_is_start) const;
    int64_t record_end(size_t idx) const;
    // Index of the record covering local_position, or -1
    long covering_record(int64_t local_position) const;

    ChunkHeader header_;
    std::atomic<bool> cached_;
    std::atomic<bool> deleting_{false};

    mutable std::shared_mutex mu_;
    std::vector<uint8_t> bytes_;
    std::vector<int64_t> record_offsets_;  // Local start of every record, ascending
};

/**
 * MemoryChunkManager - owns the chunk set of an in-memory log.
 *
 * Chunk N covers [N * chunk_data_size, (N + 1) * chunk_data_size) until a
 * scavenged replacement spanning several chunk numbers is installed with
 * replace_chunk().
 */
class MemoryChunkManager final : public ChunkManager {
public:
    struct AppendResult {
        int64_t log_position;
        int64_t post_position;
    };

    explicit MemoryChunkManager(const StorageConfig& config = StorageConfig::defaults());

    std::shared_ptr<Chunk> get_chunk_for(int64_t log_position) const override;

    // Append one record, opening a new chunk when the current one is full
    AppendResult append(const std::vector<uint8_t>& payload);

    // Position right after the last appended record
    int64_t writer_position() const;

    size_t chunk_count() const;
    int64_t chunk_data_size() const { return chunk_data_size_; }

    // Install chunk for every chunk number its header spans. The chunk
    // being written cannot be replaced.
    void replace_chunk(const std::shared_ptr<Chunk>& chunk);

    std::shared_ptr<MemoryChunk> writer_chunk() const;

private:
    std::shared_ptr<MemoryChunk> open_chunk_locked(int32_t chunk_number);

    const int64_t chunk_data_size_;
    const bool cache_new_chunks_;

    mutable std::shared_mutex mu_;
    std::vector<std::shared_ptr<Chunk>> chunks_;  // Indexed by chunk number
    std::shared_ptr<MemoryChunk> writer_chunk_;
    int64_t writer_position_ = 0;
};

} // namespace storage
} // namespace chunklog
