/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include <qtils/bytes.hpp>
#include <qtils/outcome.hpp>
#include <qtils/shared_ref.hpp>

#include "log/logger.hpp"
#include "ots/digest.hpp"
#include "ots/types.hpp"

namespace lamport::ots {

  class Signer {
   public:
    Signer(qtils::SharedRef<log::LoggingSystem> logging_system,
           qtils::SharedRef<Digest> digest);

    /**
     * Signs `digest(message)` by revealing, for every digest bit `i`, the
     * preimage `x_i^{bit}`.
     * The private key is taken by value and wiped before returning, so it
     * must be moved in and cannot be used again.
     * @return signature of `B` entries, OtsError::KEY_CONSUMED for a
     * moved-from key, OtsError::KEY_LENGTH_MISMATCH for a key of another
     * digest, OtsError::DIGEST_SIZE_MISMATCH for a digest with empty output
     */
    outcome::result<Signature> sign(PrivateKey private_key,
                                    qtils::BytesIn message) const;

   private:
    log::Logger logger_;
    qtils::SharedRef<Digest> digest_;
    size_t hash_size_;
    size_t bits_;
  };

}  // namespace lamport::ots
