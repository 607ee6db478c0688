// Copyright (C) 2025-2026 356C LLC
// SPDX-License-Identifier: GPL-3.0-or-later

#pragma once

#include <array>
#include <cstddef>
#include <cstdint>
#include <string>

/**
 * @file content_hash.h
 * @brief Portable SHA-256 used to derive stable cache identifiers
 *
 * Only used for naming cache files, never for anything security relevant.
 */

namespace thumbgrid {

/// Incremental SHA-256 (FIPS 180-4)
class Sha256 {
  public:
    using Digest = std::array<uint8_t, 32>;

    Sha256();

    void update(const void* data, size_t len);
    void update(const std::string& data) {
        update(data.data(), data.size());
    }

    /// Finalizes the hash. The object must be reset() before reuse.
    Digest finish();
    void reset();

    static std::string to_hex(const Digest& digest);

  private:
    void transform(const uint8_t block[64]);

    uint32_t state_[8];
    uint64_t total_len_ = 0;
    uint8_t block_[64];
};

/// Lowercase hex SHA-256 of a string
std::string sha256_hex(const std::string& input);

/**
 * @brief True if the identifier already looks like a content hash
 *
 * 16 to 128 characters, hex digits only, either case.
 */
bool is_hex_identifier(const std::string& id);

} // namespace thumbgrid
