/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include <string_view>

#include <qtils/byte_vec.hpp>
#include <qtils/bytes.hpp>
#include <qtils/enum_error_code.hpp>
#include <qtils/outcome.hpp>

namespace lamport::ots {

  /**
   * Hash function with a fixed output length.
   * The output length `H` determines the shape of all key material:
   * `B = 8 * H` digest bits, `2 * B` key entries and `B` signature
   * entries, each of `H` bytes.
   */
  class Digest {
   public:
    virtual ~Digest() = default;

    /// Output length in bytes
    virtual size_t size() const = 0;

    virtual qtils::ByteVec digest(qtils::BytesIn data) const = 0;
  };

  /**
   * Hashes `data` and checks that the output has the declared, non-zero
   * length.
   */
  outcome::result<qtils::ByteVec> checkedDigest(const Digest &digest,
                                                qtils::BytesIn data);

  /**
   * Bit `position` of `digest`, most significant bit of each byte first.
   */
  inline bool digestBit(qtils::BytesIn digest, size_t position) {
    return ((digest[position / 8] >> (7 - position % 8)) & 1) != 0;
  }

  enum class DigestAlgorithm : uint8_t {
    SHA2_256,
    SHA2_512,
    BLAKE2B_256,
    BLAKE2B_512,
  };

  enum class DigestAlgorithmError : uint8_t {
    UNKNOWN_ALGORITHM = 1,
  };

  /// Parses `sha2-256`, `sha2-512`, `blake2b-256` or `blake2b-512`
  outcome::result<DigestAlgorithm> digestAlgorithmFromString(
      std::string_view name);

  std::string_view toString(DigestAlgorithm algorithm);

}  // namespace lamport::ots

OUTCOME_HPP_DECLARE_ERROR(lamport::ots, DigestAlgorithmError);
