/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include "ots/key_generator.hpp"
#include "ots/ots_provider.hpp"
#include "ots/signer.hpp"
#include "ots/verifier.hpp"

namespace lamport::ots {

  class LamportProvider : public OtsProvider {
   public:
    LamportProvider(qtils::SharedRef<log::LoggingSystem> logging_system,
                    qtils::SharedRef<Digest> digest,
                    qtils::SharedRef<crypto::RandomSource> random);

    size_t hashSize() const override;

    outcome::result<Keypair> generateKeypair() override;

    outcome::result<PublicKey> derivePublicKey(
        const PrivateKey &private_key) override;

    outcome::result<Signature> sign(PrivateKey private_key,
                                    qtils::BytesIn message) override;

    outcome::result<bool> verify(const PublicKey &public_key,
                                 qtils::BytesIn message,
                                 const Signature &signature) override;

   private:
    size_t hash_size_;
    KeyGenerator key_generator_;
    Signer signer_;
    Verifier verifier_;
  };

}  // namespace lamport::ots
