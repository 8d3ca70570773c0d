/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#include "ots/verifier.hpp"

#include <openssl/crypto.h>

#include "ots/error.hpp"

namespace lamport::ots {

  Verifier::Verifier(qtils::SharedRef<log::LoggingSystem> logging_system,
                     qtils::SharedRef<Digest> digest)
      : logger_{logging_system->getLogger("Verifier", log::otsGroupName)},
        digest_{std::move(digest)},
        hash_size_{digest_->size()},
        bits_{8 * hash_size_} {}

  outcome::result<bool> Verifier::verify(const PublicKey &public_key,
                                         qtils::BytesIn message,
                                         const Signature &signature) const {
    if (bits_ == 0) {
      SL_WARN(logger_, "Digest declares an empty output");
      return OtsError::DIGEST_SIZE_MISMATCH;
    }
    if (public_key.size() != 2 * bits_
        or public_key.hashes.chunkSize() != hash_size_) {
      SL_DEBUG(logger_,
               "Public key of {} entries x {} bytes, expected {} x {}",
               public_key.size(),
               public_key.hashes.chunkSize(),
               2 * bits_,
               hash_size_);
      return OtsError::STRUCTURAL_MISMATCH;
    }
    if (signature.size() != bits_
        or signature.preimages.chunkSize() != hash_size_) {
      SL_DEBUG(logger_,
               "Signature of {} entries x {} bytes, expected {} x {}",
               signature.size(),
               signature.preimages.chunkSize(),
               bits_,
               hash_size_);
      return OtsError::STRUCTURAL_MISMATCH;
    }

    BOOST_OUTCOME_TRY(auto message_digest, checkedDigest(*digest_, message));

    bool valid = true;
    for (size_t position = 0; position < bits_; ++position) {
      auto bit = digestBit(message_digest, position);
      BOOST_OUTCOME_TRY(auto hash,
                        checkedDigest(*digest_, signature.preimages.at(position)));
      auto expected = public_key.hash(position, bit);
      valid &= CRYPTO_memcmp(hash.data(), expected.data(), hash_size_) == 0;
    }

    SL_TRACE(logger_, "Signature is {}", valid ? "valid" : "invalid");
    return valid;
  }

}  // namespace lamport::ots
