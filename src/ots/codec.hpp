/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include <qtils/byte_vec.hpp>
#include <qtils/bytes.hpp>
#include <qtils/enum_error_code.hpp>
#include <qtils/outcome.hpp>

#include "ots/types.hpp"

/**
 * Wire form of public keys and signatures: entries concatenated in index
 * order, `count * H` raw bytes without any framing.
 * A public key is `2 * 8H * H` bytes, a signature `8H * H` bytes.
 * Public key entries are interleaved, `y_0^0, y_0^1, y_1^0, y_1^1, ...`,
 * not grouped by branch. Together with the MSB-first bit order this makes
 * the encoding incompatible with encoders that write all `y_i^0` first.
 * Private keys have no wire form.
 */
namespace lamport::ots::codec {

  enum class CodecError : uint8_t {
    INVALID_LENGTH = 1,
  };

  qtils::ByteVec encode(const PublicKey &public_key);

  qtils::ByteVec encode(const Signature &signature);

  /**
   * The encoding does not name the digest. Keys of digests with the same
   * output size (SHA2-256 and BLAKE2b-256) decode into each other, and
   * verifying with the other digest yields `false`, not an error.
   */
  outcome::result<PublicKey> decodePublicKey(qtils::BytesIn bytes,
                                             size_t hash_size);

  outcome::result<Signature> decodeSignature(qtils::BytesIn bytes,
                                             size_t hash_size);

}  // namespace lamport::ots::codec

OUTCOME_HPP_DECLARE_ERROR(lamport::ots::codec, CodecError);
