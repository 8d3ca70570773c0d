/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#include "ots/types.hpp"

#include <openssl/crypto.h>

namespace lamport::ots {

  void ChunkSequence::wipe() {
    if (not bytes_.empty()) {
      OPENSSL_cleanse(bytes_.data(), bytes_.size());
    }
    bytes_.clear();
    chunk_size_ = 0;
  }

}  // namespace lamport::ots
