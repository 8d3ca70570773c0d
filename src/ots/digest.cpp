/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#include "ots/digest.hpp"

#include "ots/error.hpp"

OUTCOME_CPP_DEFINE_CATEGORY(lamport::ots, DigestAlgorithmError, e) {
  using E = lamport::ots::DigestAlgorithmError;
  switch (e) {
    case E::UNKNOWN_ALGORITHM:
      return "Unknown digest algorithm";
  }
  return "Unknown DigestAlgorithmError";
}

namespace lamport::ots {

  outcome::result<qtils::ByteVec> checkedDigest(const Digest &digest,
                                                qtils::BytesIn data) {
    if (digest.size() == 0) {
      return OtsError::DIGEST_SIZE_MISMATCH;
    }
    auto out = digest.digest(data);
    if (out.size() != digest.size()) {
      return OtsError::DIGEST_SIZE_MISMATCH;
    }
    return out;
  }

  outcome::result<DigestAlgorithm> digestAlgorithmFromString(
      std::string_view name) {
    if (name == "sha2-256" or name == "sha256") {
      return DigestAlgorithm::SHA2_256;
    }
    if (name == "sha2-512" or name == "sha512") {
      return DigestAlgorithm::SHA2_512;
    }
    if (name == "blake2b-256") {
      return DigestAlgorithm::BLAKE2B_256;
    }
    if (name == "blake2b-512") {
      return DigestAlgorithm::BLAKE2B_512;
    }
    return DigestAlgorithmError::UNKNOWN_ALGORITHM;
  }

  std::string_view toString(DigestAlgorithm algorithm) {
    switch (algorithm) {
      case DigestAlgorithm::SHA2_256:
        return "sha2-256";
      case DigestAlgorithm::SHA2_512:
        return "sha2-512";
      case DigestAlgorithm::BLAKE2B_256:
        return "blake2b-256";
      case DigestAlgorithm::BLAKE2B_512:
        return "blake2b-512";
    }
    return "unknown";
  }

}  // namespace lamport::ots
