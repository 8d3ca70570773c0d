/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#include "ots/lamport_provider.hpp"

namespace lamport::ots {

  LamportProvider::LamportProvider(
      qtils::SharedRef<log::LoggingSystem> logging_system,
      qtils::SharedRef<Digest> digest,
      qtils::SharedRef<crypto::RandomSource> random)
      : hash_size_{digest->size()},
        key_generator_{logging_system, digest, std::move(random)},
        signer_{logging_system, digest},
        verifier_{logging_system, digest} {}

  size_t LamportProvider::hashSize() const {
    return hash_size_;
  }

  outcome::result<Keypair> LamportProvider::generateKeypair() {
    return key_generator_.generate();
  }

  outcome::result<PublicKey> LamportProvider::derivePublicKey(
      const PrivateKey &private_key) {
    return key_generator_.derivePublicKey(private_key);
  }

  outcome::result<Signature> LamportProvider::sign(PrivateKey private_key,
                                                   qtils::BytesIn message) {
    return signer_.sign(std::move(private_key), message);
  }

  outcome::result<bool> LamportProvider::verify(const PublicKey &public_key,
                                                qtils::BytesIn message,
                                                const Signature &signature) {
    return verifier_.verify(public_key, message, signature);
  }

}  // namespace lamport::ots
