/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include "crypto/hash_types.hpp"
#include "crypto/hasher.hpp"

namespace lamport::crypto {

  class HasherImpl : public Hasher {
   public:
    ~HasherImpl() override = default;

    Hash256 blake2b_256(qtils::BytesIn data) const override;

    Hash512 blake2b_512(qtils::BytesIn data) const override;

    Hash256 sha2_256(qtils::BytesIn data) const override;

    Hash512 sha2_512(qtils::BytesIn data) const override;
  };

}  // namespace lamport::crypto
