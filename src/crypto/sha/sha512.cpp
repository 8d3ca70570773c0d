/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#include "crypto/sha/sha512.hpp"

#include <openssl/sha.h>

namespace lamport::crypto {
  Hash512 sha512(qtils::BytesIn input) {
    Hash512 out;
    SHA512_CTX ctx;
    SHA512_Init(&ctx);
    SHA512_Update(&ctx, input.data(), input.size());
    SHA512_Final(out.data(), &ctx);
    return out;
  }
}  // namespace lamport::crypto
