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

#include "memory_chunk.h"
#include "../util/endian.hpp"
#include "../util/log.h"
#include <algorithm>
#include <limits>
#include <mutex>
#include <sstream>

namespace chunklog {
namespace storage {

MemoryChunk::MemoryChunk(const ChunkHeader& header, bool cached)
    : header_(header), cached_(cached) {}

bool MemoryChunk::try_append(const std::vector<uint8_t>& payload, int64_t* out_log_position) {
    const int64_t frame = framed_size(payload.size());
    const uint64_t len = record::kPositionFieldSize + payload.size();
    if (len > std::numeric_limits<int32_t>::max()) {
        throw std::invalid_argument("Record payload too large: " + std::to_string(payload.size()));
    }

    std::unique_lock<std::shared_mutex> lk(mu_);
    const int64_t offset = static_cast<int64_t>(bytes_.size());
    if (offset + frame > header_.data_capacity()) {
        return false;
    }

    const int64_t log_position = header_.data_start_position() + offset;
    bytes_.resize(bytes_.size() + frame);
    uint8_t* p = bytes_.data() + offset;

    util::store_le32(p, static_cast<uint32_t>(len));
    p += record::kLengthMarkerSize;
    util::store_le64(p, static_cast<uint64_t>(log_position));
    p += record::kPositionFieldSize;
    if (!payload.empty()) {
        std::memcpy(p, payload.data(), payload.size());
        p += payload.size();
    }
    util::store_le32(p, static_cast<uint32_t>(len));

    record_offsets_.push_back(offset);
    if (out_log_position) *out_log_position = log_position;
    return true;
}

int64_t MemoryChunk::local_write_position() const {
    std::shared_lock<std::shared_mutex> lk(mu_);
    return static_cast<int64_t>(bytes_.size());
}

size_t MemoryChunk::record_count() const {
    std::shared_lock<std::shared_mutex> lk(mu_);
    return record_offsets_.size();
}

int64_t MemoryChunk::record_end(size_t idx) const {
    const int64_t offset = record_offsets_[idx];
    const uint32_t len = util::load_le32(bytes_.data() + offset);
    return offset + static_cast<int64_t>(len) + record::kFramingOverhead;
}

RecordReadResult MemoryChunk::read_record(size_t idx, bool next_is_start) const {
    const int64_t offset = record_offsets_[idx];
    const uint8_t* base = bytes_.data() + offset;
    const uint32_t len = util::load_le32(base);
    const int64_t end = offset + static_cast<int64_t>(len) + record::kFramingOverhead;

    if (len < record::kPositionFieldSize || end > static_cast<int64_t>(bytes_.size())) {
        std::ostringstream ss;
        ss << "Corrupt record frame at local offset " << offset << " in chunk #"
           << header_.chunk_start_number() << ": length " << len;
        error() << ss.str();
        throw std::runtime_error(ss.str());
    }

    const uint32_t suffix = util::load_le32(base + record::kLengthMarkerSize + len);
    if (suffix != len) {
        std::ostringstream ss;
        ss << "Corrupt record frame at local offset " << offset << " in chunk #"
           << header_.chunk_start_number() << ": prefix length " << len
           << " != suffix length " << suffix;
        error() << ss.str();
        throw std::runtime_error(ss.str());
    }

    const uint8_t* body = base + record::kLengthMarkerSize;
    const int64_t log_position = static_cast<int64_t>(util::load_le64(body));
    std::vector<uint8_t> data(body + record::kPositionFieldSize, body + len);

    auto rec = std::make_shared<const LogRecord>(log_position, std::move(data));
    return RecordReadResult::ok(std::move(rec), static_cast<int32_t>(len),
                                next_is_start ? offset : end);
}

long MemoryChunk::covering_record(int64_t local_position) const {
    // Last record starting at or before local_position
    auto it = std::upper_bound(record_offsets_.begin(), record_offsets_.end(), local_position);
    if (it == record_offsets_.begin()) return -1;
    const size_t idx = static_cast<size_t>(std::distance(record_offsets_.begin(), it) - 1);
    return local_position < record_end(idx) ? static_cast<long>(idx) : -1;
}

ChunkAccess MemoryChunk::try_read_closest_forward(int64_t local_position, RecordReadResult* out) const {
    if (is_being_deleted()) return ChunkAccess::BeingDeleted;

    std::shared_lock<std::shared_mutex> lk(mu_);
    auto it = std::lower_bound(record_offsets_.begin(), record_offsets_.end(), local_position);
    if (it == record_offsets_.end()) {
        *out = RecordReadResult::failure();
        return ChunkAccess::Ok;
    }
    *out = read_record(static_cast<size_t>(std::distance(record_offsets_.begin(), it)), false);
    return ChunkAccess::Ok;
}

ChunkAccess MemoryChunk::try_read_closest_backward(int64_t local_position, RecordReadResult* out) const {
    if (is_being_deleted()) return ChunkAccess::BeingDeleted;

    std::shared_lock<std::shared_mutex> lk(mu_);
    // Last record that ends at or before local_position
    auto it = std::lower_bound(record_offsets_.begin(), record_offsets_.end(), local_position);
    long idx = static_cast<long>(std::distance(record_offsets_.begin(), it)) - 1;
    if (idx >= 0 && record_end(static_cast<size_t>(idx)) > local_position) {
        --idx;  // local_position is inside this record
    }
    if (idx < 0) {
        *out = RecordReadResult::failure();
        return ChunkAccess::Ok;
    }
    *out = read_record(static_cast<size_t>(idx), true);
    return ChunkAccess::Ok;
}

ChunkAccess MemoryChunk::try_read_last(RecordReadResult* out) const {
    if (is_being_deleted()) return ChunkAccess::BeingDeleted;

    std::shared_lock<std::shared_mutex> lk(mu_);
    if (record_offsets_.empty()) {
        *out = RecordReadResult::failure();
        return ChunkAccess::Ok;
    }
    *out = read_record(record_offsets_.size() - 1, true);
    return ChunkAccess::Ok;
}

ChunkAccess MemoryChunk::try_read_at(int64_t local_position, RecordReadResult* out) const {
    if (is_being_deleted()) return ChunkAccess::BeingDeleted;

    std::shared_lock<std::shared_mutex> lk(mu_);
    const long idx = covering_record(local_position);
    *out = idx < 0 ? RecordReadResult::failure() : read_record(static_cast<size_t>(idx), false);
    return ChunkAccess::Ok;
}

ChunkAccess MemoryChunk::exists_at(int64_t local_position, bool* out) const {
    if (is_being_deleted()) return ChunkAccess::BeingDeleted;

    std::shared_lock<std::shared_mutex> lk(mu_);
    *out = covering_record(local_position) >= 0;
    return ChunkAccess::Ok;
}

// ---- MemoryChunkManager ----

MemoryChunkManager::MemoryChunkManager(const StorageConfig& config)
    : chunk_data_size_(config.chunk_data_size),
      cache_new_chunks_(config.cache_new_chunks) {
    config.validate_or_throw();
    std::unique_lock<std::shared_mutex> lk(mu_);
    writer_chunk_ = open_chunk_locked(0);
}

std::shared_ptr<MemoryChunk> MemoryChunkManager::open_chunk_locked(int32_t chunk_number) {
    auto chunk = std::make_shared<MemoryChunk>(
        ChunkHeader(chunk_number, chunk_number, chunk_data_size_), cache_new_chunks_);
    if (chunks_.size() <= static_cast<size_t>(chunk_number)) {
        chunks_.resize(static_cast<size_t>(chunk_number) + 1);
    }
    chunks_[chunk_number] = chunk;
    debug() << "opened chunk #" << chunk_number << " ["
            << chunk->header().data_start_position() << ", "
            << chunk->header().data_end_position() << ")";
    return chunk;
}

std::shared_ptr<Chunk> MemoryChunkManager::get_chunk_for(int64_t log_position) const {
    if (log_position < 0) {
        throw std::out_of_range("Negative log position " + std::to_string(log_position));
    }
    const int64_t number = log_position / chunk_data_size_;

    std::shared_lock<std::shared_mutex> lk(mu_);
    if (number >= static_cast<int64_t>(chunks_.size()) || !chunks_[number]) {
        throw std::out_of_range("No chunk covers log position " + std::to_string(log_position));
    }
    return chunks_[number];
}

MemoryChunkManager::AppendResult MemoryChunkManager::append(const std::vector<uint8_t>& payload) {
    if (MemoryChunk::framed_size(payload.size()) > chunk_data_size_) {
        throw std::invalid_argument("Record of " + std::to_string(payload.size()) +
                                    " bytes can never fit in a chunk of " +
                                    std::to_string(chunk_data_size_) + " bytes");
    }

    std::unique_lock<std::shared_mutex> lk(mu_);
    int64_t log_position = 0;
    if (!writer_chunk_->try_append(payload, &log_position)) {
        const int32_t next = writer_chunk_->header().chunk_end_number() + 1;
        writer_chunk_ = open_chunk_locked(next);
        if (!writer_chunk_->try_append(payload, &log_position)) {
            throw std::logic_error("Record does not fit in a freshly opened chunk");
        }
    }

    AppendResult result;
    result.log_position = log_position;
    result.post_position = log_position + MemoryChunk::framed_size(payload.size());
    writer_position_ = result.post_position;

    // A chunk filled to the last byte is complete; the writer position must
    // always be covered by some chunk
    if (result.post_position == writer_chunk_->header().data_end_position()) {
        writer_chunk_ = open_chunk_locked(writer_chunk_->header().chunk_end_number() + 1);
    }
    return result;
}

int64_t MemoryChunkManager::writer_position() const {
    std::shared_lock<std::shared_mutex> lk(mu_);
    return writer_position_;
}

size_t MemoryChunkManager::chunk_count() const {
    std::shared_lock<std::shared_mutex> lk(mu_);
    return chunks_.size();
}

std::shared_ptr<MemoryChunk> MemoryChunkManager::writer_chunk() const {
    std::shared_lock<std::shared_mutex> lk(mu_);
    return writer_chunk_;
}

void MemoryChunkManager::replace_chunk(const std::shared_ptr<Chunk>& chunk) {
    if (!chunk) {
        throw std::invalid_argument("replace_chunk: null chunk");
    }
    const ChunkHeader& h = chunk->header();
    if (h.chunk_data_size() != chunk_data_size_) {
        throw std::invalid_argument("replace_chunk: chunk data size mismatch");
    }

    std::unique_lock<std::shared_mutex> lk(mu_);
    if (h.chunk_end_number() >= writer_chunk_->header().chunk_start_number()) {
        throw std::logic_error("replace_chunk: chunk #" + std::to_string(h.chunk_end_number()) +
                               " is still being written");
    }
    for (int32_t n = h.chunk_start_number(); n <= h.chunk_end_number(); ++n) {
        chunks_[n] = chunk;
    }
    info() << "replaced chunks #" << h.chunk_start_number() << "-" << h.chunk_end_number();
}

} // namespace storage
} // namespace chunklog
