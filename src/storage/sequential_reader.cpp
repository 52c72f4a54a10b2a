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

#include "sequential_reader.h"
#include "../util/log.h"
#include <sstream>

namespace chunklog {
namespace storage {

namespace {

// Resolve the chunk for position and make sure it actually covers it;
// the traversal loops rely on that to make progress.
std::shared_ptr<Chunk> resolve_chunk(const ChunkManager& chunks, int64_t position) {
    std::shared_ptr<Chunk> chunk = chunks.get_chunk_for(position);
    if (!chunk) {
        throw std::out_of_range("No chunk for log position " + std::to_string(position));
    }
    if (!chunk->header().contains(position)) {
        std::ostringstream ss;
        ss << "Chunk manager returned chunk [" << chunk->header().data_start_position()
           << ", " << chunk->header().data_end_position()
           << ") for log position " << position;
        error() << ss.str();
        throw std::out_of_range(ss.str());
    }
    return chunk;
}

} // namespace

SequentialReader::SequentialReader(const ChunkManager& chunks,
                                   const Checkpoint& writer_checkpoint,
                                   int64_t initial_position,
                                   const StorageConfig& config,
                                   ReadStats* stats)
    : chunks_(chunks),
      writer_checkpoint_(writer_checkpoint),
      max_retries_(config.max_read_retries),
      stats_(stats),
      current_position_(initial_position) {
    if (initial_position < 0) {
        throw std::invalid_argument("SequentialReader: initial position must be non-negative, got " +
                                    std::to_string(initial_position));
    }
    if (max_retries_ < 0) {
        throw std::invalid_argument("SequentialReader: max_read_retries must be non-negative");
    }
    if (!stats_) {
        owned_stats_ = std::make_unique<ReadStats>();
        stats_ = owned_stats_.get();
    }
}

void SequentialReader::on_chunk_being_deleted(int* retries, const char* op, int64_t position) {
    stats_->transient_retries.increment();
    if (*retries >= max_retries_) {
        std::ostringstream ss;
        ss << op << ": chunk covering position " << position << " was being deleted "
           << (*retries + 1) << " times in a row (retry bound " << max_retries_
           << "), likely a bug in the chunk manager";
        error() << ss.str();
        throw ChunkRetriesExhausted(ss.str());
    }
    ++*retries;
    debug() << op << ": chunk covering " << position << " is being deleted, retry "
            << *retries << "/" << max_retries_;
}

SeqReadResult SequentialReader::make_result(const RecordReadResult& result,
                                            const ChunkHeader& header,
                                            int64_t writer_chk) {
    current_position_ = header.data_start_position() + result.next_position;

    SeqReadResult seq;
    seq.success = true;
    seq.record = result.record;
    seq.record_length = result.record_length;
    seq.record_pre_position = result.record->log_position;
    seq.record_post_position = record_post_position(result.record->log_position, result.record_length);
    seq.eof = seq.record_post_position == writer_chk;
    return seq;
}

SeqReadResult SequentialReader::try_read_next() {
    int retries = 0;
    while (true) {
        const int64_t position = current_position_;
        const int64_t writer_chk = writer_checkpoint_.read();
        if (position >= writer_chk) {
            return SeqReadResult::failure();
        }

        std::shared_ptr<Chunk> chunk = resolve_chunk(chunks_, position);
        const ChunkHeader& header = chunk->header();

        RecordReadResult result;
        if (chunk->try_read_closest_forward(header.local_data_position(position), &result)
                == ChunkAccess::BeingDeleted) {
            on_chunk_being_deleted(&retries, "try_read_next", position);
            continue;
        }
        stats_->count(chunk->is_cached());

        if (result.success) {
            // Only reachable when repositioned off a record boundary: the
            // closest record is not durable yet
            if (record_post_position(result.record->log_position, result.record_length) > writer_chk) {
                return SeqReadResult::failure();
            }
            return make_result(result, header, writer_chk);
        }

        // Past the last record of this chunk: continue at the start of the next one
        current_position_ = header.data_end_position();
    }
}

SeqReadResult SequentialReader::try_read_prev() {
    int retries = 0;
    while (true) {
        const int64_t position = current_position_;
        const int64_t writer_chk = writer_checkpoint_.read();
        // == writer_chk is allowed, that reads the very last record
        if (position > writer_chk) {
            std::ostringstream ss;
            ss << "Requested position " << position << " is greater than writer checkpoint "
               << writer_chk << " when requesting to read previous record";
            error() << ss.str();
            throw InvalidReadRequest(ss.str());
        }
        if (position <= 0) {
            return SeqReadResult::failure();
        }

        std::shared_ptr<Chunk> chunk = resolve_chunk(chunks_, position);
        bool read_last = false;
        if (position == chunk->header().data_start_position()) {
            // Exactly on a physical chunk boundary: the previous record is
            // the last one of the previous chunk
            read_last = true;
            chunk = resolve_chunk(chunks_, position - 1);
        }
        const ChunkHeader& header = chunk->header();

        RecordReadResult result;
        ChunkAccess access = read_last
            ? chunk->try_read_last(&result)
            : chunk->try_read_closest_backward(header.local_data_position(position), &result);
        if (access == ChunkAccess::BeingDeleted) {
            on_chunk_being_deleted(&retries, "try_read_prev", position);
            continue;
        }
        stats_->count(chunk->is_cached());

        if (result.success) {
            return make_result(result, header, writer_chk);
        }

        // Nothing before the cursor in this chunk. Park on the chunk start;
        // the next iteration sees the boundary and switches to the previous chunk.
        current_position_ = header.data_start_position();
    }
}

RecordReadResult SequentialReader::try_read_at(int64_t position) {
    int retries = 0;
    while (true) {
        const int64_t writer_chk = writer_checkpoint_.read();
        if (position >= writer_chk) {
            return RecordReadResult::failure();
        }

        std::shared_ptr<Chunk> chunk = resolve_chunk(chunks_, position);
        RecordReadResult result;
        if (chunk->try_read_at(chunk->header().local_data_position(position), &result)
                == ChunkAccess::BeingDeleted) {
            on_chunk_being_deleted(&retries, "try_read_at", position);
            continue;
        }
        stats_->count(chunk->is_cached());
        return result;
    }
}

bool SequentialReader::exists_at(int64_t position) {
    int retries = 0;
    while (true) {
        const int64_t writer_chk = writer_checkpoint_.read();
        if (position >= writer_chk) {
            return false;
        }

        std::shared_ptr<Chunk> chunk = resolve_chunk(chunks_, position);
        bool exists = false;
        if (chunk->exists_at(chunk->header().local_data_position(position), &exists)
                == ChunkAccess::BeingDeleted) {
            on_chunk_being_deleted(&retries, "exists_at", position);
            continue;
        }
        stats_->count(chunk->is_cached());
        return exists;
    }
}

} // namespace storage
} // namespace chunklog
