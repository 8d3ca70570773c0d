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

  class Verifier {
   public:
    Verifier(qtils::SharedRef<log::LoggingSystem> logging_system,
             qtils::SharedRef<Digest> digest);

    /**
     * Checks that every revealed preimage hashes to the public key entry
     * selected by the corresponding bit of `digest(message)`.
     * All entries are compared, there is no early exit on mismatch.
     * @return true if the signature is valid, false if it is not,
     * OtsError::STRUCTURAL_MISMATCH if the public key or the signature does
     * not have the shape of the configured digest,
     * OtsError::DIGEST_SIZE_MISMATCH if the digest declares an empty output
     */
    outcome::result<bool> verify(const PublicKey &public_key,
                                 qtils::BytesIn message,
                                 const Signature &signature) const;

   private:
    log::Logger logger_;
    qtils::SharedRef<Digest> digest_;
    size_t hash_size_;
    size_t bits_;
  };

}  // namespace lamport::ots
