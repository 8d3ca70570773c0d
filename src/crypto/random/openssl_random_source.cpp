/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#include "crypto/random/openssl_random_source.hpp"

#include <algorithm>
#include <climits>

#include <openssl/rand.h>

namespace lamport::crypto {

  outcome::result<void> OpensslRandomSource::fill(qtils::BytesOut out) {
    // RAND_bytes takes an int length
    constexpr size_t kMaxChunk = INT_MAX;
    for (size_t offset = 0; offset < out.size();) {
      auto chunk = std::min(kMaxChunk, out.size() - offset);
      if (RAND_bytes(out.data() + offset, static_cast<int>(chunk)) != 1) {
        return RandomError::EXHAUSTED;
      }
      offset += chunk;
    }
    return outcome::success();
  }

}  // namespace lamport::crypto
