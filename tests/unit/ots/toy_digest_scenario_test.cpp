/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#include <gtest/gtest.h>

#include <algorithm>
#include <array>

#include <qtils/bytestr.hpp>
#include <qtils/test/outcome.hpp>

#include "ots/key_generator.hpp"
#include "ots/signer.hpp"
#include "ots/verifier.hpp"
#include "testutil/prepare_loggers.hpp"
#include "testutil/sequential_random_source.hpp"
#include "testutil/toy_digest.hpp"

using lamport::ots::KeyGenerator;
using lamport::ots::pairIndex;
using lamport::ots::Signer;
using lamport::ots::Verifier;

/**
 * Eight bit digest: digest("hello") = 0b10110010, so positions 0..7 reveal
 * x_0^1, x_1^0, x_2^1, x_3^1, x_4^0, x_5^0, x_6^1, x_7^0.
 */
class ToyDigestScenarioTest : public ::testing::Test {
 protected:
  void SetUp() override {
    auto logging_system = testutil::prepareLoggers();
    auto digest = std::make_shared<testutil::ToyDigest>();
    generator_ = std::make_unique<KeyGenerator>(
        logging_system,
        digest,
        std::make_shared<testutil::SequentialRandomSource>());
    signer_ = std::make_unique<Signer>(logging_system, digest);
    verifier_ = std::make_unique<Verifier>(logging_system, digest);
  }

  std::unique_ptr<KeyGenerator> generator_;
  std::unique_ptr<Signer> signer_;
  std::unique_ptr<Verifier> verifier_;
};

TEST_F(ToyDigestScenarioTest, KeyShape) {
  ASSERT_OUTCOME_SUCCESS(keypair, generator_->generate());
  EXPECT_EQ(keypair.private_key.preimages().count(), 16);
  EXPECT_EQ(keypair.private_key.preimages().chunkSize(), 1);
  EXPECT_EQ(keypair.public_key.size(), 16);

  // sequential randomness: x_i^b = 2i + b
  for (size_t position = 0; position < 8; ++position) {
    EXPECT_EQ(keypair.private_key.preimage(position, false)[0], 2 * position);
    EXPECT_EQ(keypair.private_key.preimage(position, true)[0],
              2 * position + 1);
  }
}

TEST_F(ToyDigestScenarioTest, SignHello) {
  auto keypair = generator_->generate().value();
  auto secrets = keypair.private_key.preimages();
  auto hello = qtils::str2byte("hello");

  ASSERT_OUTCOME_SUCCESS(signature,
                         signer_->sign(std::move(keypair.private_key), hello));
  ASSERT_EQ(signature.size(), 8);

  const std::array<bool, 8> bits{1, 0, 1, 1, 0, 0, 1, 0};
  for (size_t position = 0; position < 8; ++position) {
    EXPECT_TRUE(std::ranges::equal(
        signature.preimages.at(position),
        secrets.at(pairIndex(position, bits[position]))))
        << "position " << position;
  }
  // first entries are x_0^1 = 1 and x_1^0 = 2
  EXPECT_EQ(signature.preimages.at(0)[0], 1);
  EXPECT_EQ(signature.preimages.at(1)[0], 2);

  ASSERT_OUTCOME_SUCCESS(valid,
                         verifier_->verify(keypair.public_key, hello, signature));
  EXPECT_TRUE(valid);
}

TEST_F(ToyDigestScenarioTest, RevealingOtherBranchFails) {
  auto keypair = generator_->generate().value();
  auto secrets = keypair.private_key.preimages();
  auto hello = qtils::str2byte("hello");
  auto signature =
      signer_->sign(std::move(keypair.private_key), hello).value();

  // position 0 has bit 1, reveal x_0^0 instead
  auto forged = signature;
  forged.preimages.at(0)[0] = secrets.at(pairIndex(0, false))[0];
  ASSERT_OUTCOME_SUCCESS(valid,
                         verifier_->verify(keypair.public_key, hello, forged));
  EXPECT_FALSE(valid);
}
