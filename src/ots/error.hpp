/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include <qtils/enum_error_code.hpp>

namespace lamport::ots {

  /**
   * Errors of key generation, signing and verification.
   * An invalid signature is not an error, `verify` reports it as `false`.
   */
  enum class OtsError : uint8_t {
    /// private key shape does not match the configured digest
    KEY_LENGTH_MISMATCH = 1,
    /// public key or signature shape does not match the configured digest
    STRUCTURAL_MISMATCH,
    /// private key was already used to sign or moved from
    KEY_CONSUMED,
    /// digest declares an empty output or returned one of unexpected length
    DIGEST_SIZE_MISMATCH,
  };

}  // namespace lamport::ots

OUTCOME_HPP_DECLARE_ERROR(lamport::ots, OtsError);
