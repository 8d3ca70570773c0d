/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include <qtils/outcome.hpp>
#include <qtils/shared_ref.hpp>

#include "crypto/random/random_source.hpp"
#include "log/logger.hpp"
#include "ots/digest.hpp"
#include "ots/types.hpp"

namespace lamport::ots {

  /**
   * Generates Lamport key pairs for one digest.
   *
   * For every digest bit `i` two preimages `x_i^0`, `x_i^1` of `H` bytes
   * are drawn from the random source, and the public key holds
   * `y_i^b = digest(x_i^b)` at the same positions.
   */
  class KeyGenerator {
   public:
    KeyGenerator(qtils::SharedRef<log::LoggingSystem> logging_system,
                 qtils::SharedRef<Digest> digest,
                 qtils::SharedRef<crypto::RandomSource> random);

    /**
     * @return fresh key pair, or the random source error unchanged
     */
    outcome::result<Keypair> generate() const;

    /**
     * Recomputes the public key of a fresh private key.
     */
    outcome::result<PublicKey> derivePublicKey(
        const PrivateKey &private_key) const;

   private:
    outcome::result<PublicKey> hashPreimages(
        const ChunkSequence &preimages) const;

    log::Logger logger_;
    qtils::SharedRef<Digest> digest_;
    qtils::SharedRef<crypto::RandomSource> random_;
    size_t hash_size_;
    size_t bits_;
  };

}  // namespace lamport::ots
