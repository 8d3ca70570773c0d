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
   * Take a SHA-512 hash from bytes
   */
  Hash512 sha512(qtils::BytesIn input);

}  // namespace lamport::crypto
