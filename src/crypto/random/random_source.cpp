/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#include "crypto/random/random_source.hpp"

OUTCOME_CPP_DEFINE_CATEGORY(lamport::crypto, RandomError, e) {
  using E = lamport::crypto::RandomError;
  switch (e) {
    case E::EXHAUSTED:
      return "Randomness source could not supply the requested bytes";
  }
  return "Unknown RandomError";
}
