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
#include <cstdlib>
#include <string>
#include <stdexcept>
#include "config.h"  // For defaults

namespace chunklog {
namespace storage {

/**
 * Runtime configuration for the log storage core
 * Can be customized per log instead of compile-time constants
 */
struct StorageConfig {
    // Transient-deletion retries per read operation
    int     max_read_retries  = reader::kMaxRetries;

    // Bytes of record data per chunk (MemoryChunkManager)
    int64_t chunk_data_size   = chunk::kDefaultDataSize;

    // Whether newly opened chunks report themselves as memory-resident
    bool    cache_new_chunks  = true;

    /**
     * Create config with defaults, optionally reading from environment
     */
    static StorageConfig defaults() {
        StorageConfig cfg;

        if (const char* env = std::getenv(reader::kMaxRetriesEnvVar)) {
            cfg.max_read_retries = std::stoi(env);
        }

        if (const char* env = std::getenv(chunk::kDataSizeEnvVar)) {
            cfg.chunk_data_size = std::stoll(env);
        }

        if (const char* env = std::getenv(chunk::kCacheEnvVar)) {
            cfg.cache_new_chunks = (std::string(env) != "0");
        }

        return cfg;
    }

    /**
     * Config with small chunks, handy for exercising chunk boundaries
     */
    static StorageConfig small_chunks(int64_t data_size = 1000) {
        StorageConfig cfg;
        cfg.chunk_data_size = data_size;
        return cfg;
    }

    /**
     * Validate configuration
     */
    bool validate() const {
        if (max_read_retries < 0) {
            return false;
        }
        if (chunk_data_size < chunk::kMinDataSize) {
            return false;
        }
        return true;
    }

    void validate_or_throw() const {
        if (!validate()) {
            throw std::invalid_argument(
                "Invalid storage config: max_read_retries=" + std::to_string(max_read_retries) +
                " chunk_data_size=" + std::to_string(chunk_data_size));
        }
    }
};

} // namespace storage
} // namespace chunklog
