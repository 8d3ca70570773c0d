/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#include "crypto/hasher/hasher_impl.hpp"

#include "crypto/blake.hpp"
#include "crypto/sha/sha256.hpp"
#include "crypto/sha/sha512.hpp"

namespace lamport::crypto {

  Hash256 HasherImpl::blake2b_256(qtils::BytesIn data) const {
    return Blake2b<32>::hash(data);
  }

  Hash512 HasherImpl::blake2b_512(qtils::BytesIn data) const {
    return Blake2b<64>::hash(data);
  }

  Hash256 HasherImpl::sha2_256(qtils::BytesIn data) const {
    return sha256(data);
  }

  Hash512 HasherImpl::sha2_512(qtils::BytesIn data) const {
    return sha512(data);
  }

}  // namespace lamport::crypto
