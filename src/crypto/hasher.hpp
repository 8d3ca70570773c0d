/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include <qtils/bytes.hpp>

#include "crypto/hash_types.hpp"

namespace lamport::crypto {

  class Hasher {
   public:
    virtual ~Hasher() = default;

    /**
     * @brief blake2b_256 function calculates 32-byte blake2b hash
     * @param data source value
     * @return 256-bit hash value
     */
    virtual Hash256 blake2b_256(qtils::BytesIn data) const = 0;

    /**
     * @brief blake2b_512 function calculates 64-byte blake2b hash
     * @param data source value
     * @return 512-bit hash value
     */
    virtual Hash512 blake2b_512(qtils::BytesIn data) const = 0;

    /**
     * @brief sha2_256 function calculates 32-byte sha2-256 hash
     * @param data source value
     * @return 256-bit hash value
     */
    virtual Hash256 sha2_256(qtils::BytesIn data) const = 0;

    /**
     * @brief sha2_512 function calculates 64-byte sha2-512 hash
     * @param data source value
     * @return 512-bit hash value
     */
    virtual Hash512 sha2_512(qtils::BytesIn data) const = 0;
  };
}  // namespace lamport::crypto
