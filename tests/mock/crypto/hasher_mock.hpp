/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include <gmock/gmock.h>

#include "crypto/hasher.hpp"

namespace lamport::crypto {

  class HasherMock : public Hasher {
   public:
    ~HasherMock() override = default;

    MOCK_METHOD(Hash256, blake2b_256, (qtils::BytesIn), (const, override));

    MOCK_METHOD(Hash512, blake2b_512, (qtils::BytesIn), (const, override));

    MOCK_METHOD(Hash256, sha2_256, (qtils::BytesIn), (const, override));

    MOCK_METHOD(Hash512, sha2_512, (qtils::BytesIn), (const, override));
  };

}  // namespace lamport::crypto
