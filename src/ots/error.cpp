/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#include "ots/error.hpp"

OUTCOME_CPP_DEFINE_CATEGORY(lamport::ots, OtsError, e) {
  using E = lamport::ots::OtsError;
  switch (e) {
    case E::KEY_LENGTH_MISMATCH:
      return "Private key length does not match the digest";
    case E::STRUCTURAL_MISMATCH:
      return "Public key or signature length does not match the digest";
    case E::KEY_CONSUMED:
      return "Private key has already been consumed";
    case E::DIGEST_SIZE_MISMATCH:
      return "Digest output length differs from its declared size";
  }
  return "Unknown OtsError";
}
