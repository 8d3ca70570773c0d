/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include <qtils/shared_ref.hpp>

#include "crypto/hasher.hpp"
#include "ots/digest.hpp"

namespace lamport::ots {

  /**
   * Digest computed by one of the `crypto::Hasher` functions.
   */
  class HasherDigest : public Digest {
   public:
    HasherDigest(qtils::SharedRef<crypto::Hasher> hasher,
                 DigestAlgorithm algorithm);

    size_t size() const override;

    qtils::ByteVec digest(qtils::BytesIn data) const override;

   private:
    qtils::SharedRef<crypto::Hasher> hasher_;
    DigestAlgorithm algorithm_;
  };

}  // namespace lamport::ots
