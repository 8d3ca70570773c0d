/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#include "ots/codec.hpp"

OUTCOME_CPP_DEFINE_CATEGORY(lamport::ots::codec, CodecError, e) {
  using E = lamport::ots::codec::CodecError;
  switch (e) {
    case E::INVALID_LENGTH:
      return "Encoded length does not match the digest size";
  }
  return "Unknown CodecError";
}

namespace lamport::ots::codec {

  namespace {
    outcome::result<ChunkSequence> decodeChunks(qtils::BytesIn bytes,
                                                size_t count,
                                                size_t hash_size) {
      if (hash_size == 0 or bytes.size() != count * hash_size) {
        return CodecError::INVALID_LENGTH;
      }
      return ChunkSequence{qtils::ByteVec(bytes.begin(), bytes.end()),
                           hash_size};
    }
  }  // namespace

  qtils::ByteVec encode(const PublicKey &public_key) {
    return public_key.hashes.bytes();
  }

  qtils::ByteVec encode(const Signature &signature) {
    return signature.preimages.bytes();
  }

  outcome::result<PublicKey> decodePublicKey(qtils::BytesIn bytes,
                                             size_t hash_size) {
    BOOST_OUTCOME_TRY(auto hashes,
                      decodeChunks(bytes, 2 * 8 * hash_size, hash_size));
    return PublicKey{std::move(hashes)};
  }

  outcome::result<Signature> decodeSignature(qtils::BytesIn bytes,
                                             size_t hash_size) {
    BOOST_OUTCOME_TRY(auto preimages,
                      decodeChunks(bytes, 8 * hash_size, hash_size));
    return Signature{std::move(preimages)};
  }

}  // namespace lamport::ots::codec
