/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#include "ots/signer.hpp"

#include <algorithm>

#include "ots/error.hpp"

namespace lamport::ots {

  Signer::Signer(qtils::SharedRef<log::LoggingSystem> logging_system,
                 qtils::SharedRef<Digest> digest)
      : logger_{logging_system->getLogger("Signer", log::otsGroupName)},
        digest_{std::move(digest)},
        hash_size_{digest_->size()},
        bits_{8 * hash_size_} {}

  outcome::result<Signature> Signer::sign(PrivateKey private_key,
                                          qtils::BytesIn message) const {
    if (bits_ == 0) {
      SL_WARN(logger_, "Digest declares an empty output");
      return OtsError::DIGEST_SIZE_MISMATCH;
    }
    if (private_key.consumed()) {
      SL_WARN(logger_, "Attempt to sign with a consumed private key");
      return OtsError::KEY_CONSUMED;
    }
    const auto &preimages = private_key.preimages();
    if (preimages.count() != 2 * bits_
        or preimages.chunkSize() != hash_size_) {
      SL_WARN(logger_,
              "Private key of {} entries x {} bytes, expected {} x {}",
              preimages.count(),
              preimages.chunkSize(),
              2 * bits_,
              hash_size_);
      return OtsError::KEY_LENGTH_MISMATCH;
    }

    BOOST_OUTCOME_TRY(auto message_digest, checkedDigest(*digest_, message));

    Signature signature{ChunkSequence{bits_, hash_size_}};
    for (size_t position = 0; position < bits_; ++position) {
      auto bit = digestBit(message_digest, position);
      std::ranges::copy(private_key.preimage(position, bit),
                        signature.preimages.at(position).begin());
    }

    SL_TRACE(logger_,
             "Signed message of {} bytes, private key is consumed",
             message.size());
    return signature;
  }

}  // namespace lamport::ots
