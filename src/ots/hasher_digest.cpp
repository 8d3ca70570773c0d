/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#include "ots/hasher_digest.hpp"

namespace lamport::ots {

  namespace {
    template <size_t N>
    qtils::ByteVec toVec(const qtils::ByteArr<N> &hash) {
      return qtils::ByteVec(hash.begin(), hash.end());
    }
  }  // namespace

  HasherDigest::HasherDigest(qtils::SharedRef<crypto::Hasher> hasher,
                             DigestAlgorithm algorithm)
      : hasher_{std::move(hasher)}, algorithm_{algorithm} {}

  size_t HasherDigest::size() const {
    switch (algorithm_) {
      case DigestAlgorithm::SHA2_256:
      case DigestAlgorithm::BLAKE2B_256:
        return Hash256{}.size();
      case DigestAlgorithm::SHA2_512:
      case DigestAlgorithm::BLAKE2B_512:
        return Hash512{}.size();
    }
    return 0;
  }

  qtils::ByteVec HasherDigest::digest(qtils::BytesIn data) const {
    switch (algorithm_) {
      case DigestAlgorithm::SHA2_256:
        return toVec(hasher_->sha2_256(data));
      case DigestAlgorithm::SHA2_512:
        return toVec(hasher_->sha2_512(data));
      case DigestAlgorithm::BLAKE2B_256:
        return toVec(hasher_->blake2b_256(data));
      case DigestAlgorithm::BLAKE2B_512:
        return toVec(hasher_->blake2b_512(data));
    }
    return {};
  }

}  // namespace lamport::ots
