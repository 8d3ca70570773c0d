/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#include "ots/key_generator.hpp"

#include <algorithm>

#include "ots/error.hpp"

namespace lamport::ots {

  KeyGenerator::KeyGenerator(
      qtils::SharedRef<log::LoggingSystem> logging_system,
      qtils::SharedRef<Digest> digest,
      qtils::SharedRef<crypto::RandomSource> random)
      : logger_{logging_system->getLogger("KeyGenerator", log::otsGroupName)},
        digest_{std::move(digest)},
        random_{std::move(random)},
        hash_size_{digest_->size()},
        bits_{8 * hash_size_} {}

  outcome::result<Keypair> KeyGenerator::generate() const {
    if (bits_ == 0) {
      SL_WARN(logger_, "Digest declares an empty output");
      return OtsError::DIGEST_SIZE_MISMATCH;
    }
    ChunkSequence preimages{2 * bits_, hash_size_};
    if (auto res = random_->fill(preimages.mutableBytes()); res.has_error()) {
      SL_WARN(logger_,
              "Can't draw {} random bytes for private key: {}",
              preimages.bytes().size(),
              res.error());
      preimages.wipe();
      return res.error();
    }
    PrivateKey private_key{std::move(preimages)};

    BOOST_OUTCOME_TRY(auto public_key,
                      hashPreimages(private_key.preimages()));

    SL_DEBUG(logger_,
             "Generated key pair of {} preimage pairs, {} bytes each",
             bits_,
             hash_size_);
    return Keypair{
        .private_key = std::move(private_key),
        .public_key = std::move(public_key),
    };
  }

  outcome::result<PublicKey> KeyGenerator::derivePublicKey(
      const PrivateKey &private_key) const {
    if (bits_ == 0) {
      return OtsError::DIGEST_SIZE_MISMATCH;
    }
    if (private_key.consumed()) {
      return OtsError::KEY_CONSUMED;
    }
    const auto &preimages = private_key.preimages();
    if (preimages.count() != 2 * bits_
        or preimages.chunkSize() != hash_size_) {
      return OtsError::KEY_LENGTH_MISMATCH;
    }
    return hashPreimages(preimages);
  }

  outcome::result<PublicKey> KeyGenerator::hashPreimages(
      const ChunkSequence &preimages) const {
    PublicKey public_key{ChunkSequence{preimages.count(), hash_size_}};
    for (size_t index = 0; index < preimages.count(); ++index) {
      BOOST_OUTCOME_TRY(auto hash, checkedDigest(*digest_, preimages.at(index)));
      std::ranges::copy(hash, public_key.hashes.at(index).begin());
    }
    return public_key;
  }

}  // namespace lamport::ots
