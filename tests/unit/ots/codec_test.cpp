/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#include <gtest/gtest.h>

#include <unordered_set>

#include <qtils/bytestr.hpp>
#include <qtils/test/outcome.hpp>

#include "crypto/hasher/hasher_impl.hpp"
#include "crypto/random/openssl_random_source.hpp"
#include "ots/codec.hpp"
#include "ots/hasher_digest.hpp"
#include "ots/lamport_provider.hpp"
#include "testutil/prepare_loggers.hpp"

using lamport::crypto::HasherImpl;
using lamport::crypto::OpensslRandomSource;
using lamport::ots::DigestAlgorithm;
using lamport::ots::HasherDigest;
using lamport::ots::LamportProvider;
using lamport::ots::PublicKey;
using lamport::ots::codec::CodecError;
using lamport::ots::codec::decodePublicKey;
using lamport::ots::codec::decodeSignature;
using lamport::ots::codec::encode;

auto message = qtils::str2byte("codec");

class CodecTest : public ::testing::Test {
 protected:
  void SetUp() override {
    provider_ = std::make_unique<LamportProvider>(
        testutil::prepareLoggers(),
        std::make_shared<HasherDigest>(std::make_shared<HasherImpl>(),
                                       DigestAlgorithm::SHA2_512),
        std::make_shared<OpensslRandomSource>());
  }

  std::unique_ptr<LamportProvider> provider_;
};

TEST_F(CodecTest, PublicKeyRoundTrip) {
  auto keypair = provider_->generateKeypair().value();
  auto bytes = encode(keypair.public_key);
  EXPECT_EQ(bytes.size(), 2 * 512 * 64);

  ASSERT_OUTCOME_SUCCESS(decoded, decodePublicKey(bytes, 64));
  EXPECT_EQ(decoded, keypair.public_key);
}

TEST_F(CodecTest, DecodedKeysVerify) {
  auto keypair = provider_->generateKeypair().value();
  auto public_bytes = encode(keypair.public_key);
  auto signature =
      provider_->sign(std::move(keypair.private_key), message).value();
  auto signature_bytes = encode(signature);
  EXPECT_EQ(signature_bytes.size(), 512 * 64);

  ASSERT_OUTCOME_SUCCESS(public_key, decodePublicKey(public_bytes, 64));
  ASSERT_OUTCOME_SUCCESS(decoded, decodeSignature(signature_bytes, 64));
  EXPECT_EQ(decoded, signature);
  ASSERT_OUTCOME_SUCCESS(valid, provider_->verify(public_key, message, decoded));
  EXPECT_TRUE(valid);
}

TEST_F(CodecTest, TruncatedPublicKey) {
  auto keypair = provider_->generateKeypair().value();
  auto bytes = encode(keypair.public_key);
  bytes.pop_back();

  auto res = decodePublicKey(bytes, 64);
  ASSERT_TRUE(res.has_error());
  EXPECT_EQ(res.error(), CodecError::INVALID_LENGTH);
}

TEST_F(CodecTest, PublicKeyOfOtherDigest) {
  auto keypair = provider_->generateKeypair().value();
  auto bytes = encode(keypair.public_key);

  auto res = decodePublicKey(bytes, 32);
  ASSERT_TRUE(res.has_error());
  EXPECT_EQ(res.error(), CodecError::INVALID_LENGTH);
}

TEST(CodecInputTest, SignatureLength) {
  qtils::ByteVec bytes(8 * 32 * 32 + 1, 0);
  auto res = decodeSignature(bytes, 32);
  ASSERT_TRUE(res.has_error());
  EXPECT_EQ(res.error(), CodecError::INVALID_LENGTH);

  bytes.pop_back();
  ASSERT_OUTCOME_SUCCESS(signature, decodeSignature(bytes, 32));
  EXPECT_EQ(signature.size(), 256);
}

TEST(CodecInputTest, ZeroHashSize) {
  auto res = decodePublicKey({}, 0);
  ASSERT_TRUE(res.has_error());
  EXPECT_EQ(res.error(), CodecError::INVALID_LENGTH);
}

TEST_F(CodecTest, PublicKeyHash) {
  auto first = provider_->generateKeypair().value().public_key;
  auto second = provider_->generateKeypair().value().public_key;
  auto copy = decodePublicKey(encode(first), 64).value();

  std::unordered_set<PublicKey> keys{first, second, copy};
  EXPECT_EQ(keys.size(), 2);
  EXPECT_TRUE(keys.contains(copy));
  EXPECT_EQ(std::hash<PublicKey>{}(first), std::hash<PublicKey>{}(copy));
}

TEST_F(CodecTest, KeyOfSameSizeDigestDoesNotVerify) {
  LamportProvider sha_provider{
      testutil::prepareLoggers(),
      std::make_shared<HasherDigest>(std::make_shared<HasherImpl>(),
                                     DigestAlgorithm::SHA2_256),
      std::make_shared<OpensslRandomSource>()};
  LamportProvider blake_provider{
      testutil::prepareLoggers(),
      std::make_shared<HasherDigest>(std::make_shared<HasherImpl>(),
                                     DigestAlgorithm::BLAKE2B_256),
      std::make_shared<OpensslRandomSource>()};

  auto keypair = sha_provider.generateKeypair().value();
  auto signature =
      sha_provider.sign(std::move(keypair.private_key), message).value();

  // same shape, so decoding under the other digest succeeds
  ASSERT_OUTCOME_SUCCESS(public_key,
                         decodePublicKey(encode(keypair.public_key), 32));
  ASSERT_OUTCOME_SUCCESS(
      valid, blake_provider.verify(public_key, message, signature));
  EXPECT_FALSE(valid);
}
