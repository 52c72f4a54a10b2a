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
#include <cstddef>

namespace chunklog {
namespace storage {

// Sequential reader configuration
namespace reader {
    // Transient "chunk being deleted" retries allowed per read operation.
    // A chunk still backing data below the durable boundary should never be
    // reclaimed, so running out of retries points at a chunk lifecycle bug.
    constexpr int kMaxRetries = 20;
    constexpr const char* kMaxRetriesEnvVar = "CHUNKLOG_READER_MAX_RETRIES";
}

// Record framing shared with the chunk writer
namespace record {
    // Every record is framed by a 4-byte length before and after its payload:
    //   [len:u32][payload (len bytes)][len:u32]
    constexpr size_t kLengthMarkerSize = sizeof(int32_t);
    constexpr int64_t kFramingOverhead = 2 * kLengthMarkerSize;

    // Payload starts with the record's absolute log position (u64 LE)
    constexpr size_t kPositionFieldSize = sizeof(int64_t);
}

// Chunk configuration
namespace chunk {
    constexpr int64_t kDefaultDataSize = 256 * 1024 * 1024;  // 256MB of record data per chunk
    constexpr int64_t kMinDataSize = 64;                      // Room for at least one small record
    constexpr const char* kDataSizeEnvVar = "CHUNKLOG_CHUNK_DATA_SIZE";
    constexpr const char* kCacheEnvVar = "CHUNKLOG_CACHE_CHUNKS";
}

// Checkpoint configuration
namespace checkpoint {
    constexpr int64_t kDefaultInitialValue = 0;
}

} // namespace storage
} // namespace chunklog
