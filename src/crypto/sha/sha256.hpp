/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include <qtils/bytes.hpp>

#include "crypto/hash_types.hpp"

namespace lamport::crypto {

  /**
   * Take a SHA-256 hash from bytes
   * @param input to be hashed
   * @return hashed bytes
   */
  Hash256 sha256(qtils::BytesIn input);

}  // namespace lamport::crypto
