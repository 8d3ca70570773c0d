/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include <qtils/bytes.hpp>
#include <qtils/outcome.hpp>

#include "ots/types.hpp"

namespace lamport::ots {

  /**
   * One-time signature scheme bound to a digest and a random source.
   */
  class OtsProvider {
   public:
    virtual ~OtsProvider() = default;

    /// Digest output length `H` in bytes
    virtual size_t hashSize() const = 0;

    virtual outcome::result<Keypair> generateKeypair() = 0;

    virtual outcome::result<PublicKey> derivePublicKey(
        const PrivateKey &private_key) = 0;

    virtual outcome::result<Signature> sign(PrivateKey private_key,
                                            qtils::BytesIn message) = 0;

    virtual outcome::result<bool> verify(const PublicKey &public_key,
                                         qtils::BytesIn message,
                                         const Signature &signature) = 0;
  };
}  // namespace lamport::ots
