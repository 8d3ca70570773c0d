/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include <gmock/gmock.h>

#include "crypto/random/random_source.hpp"

namespace lamport::crypto {

  class RandomSourceMock : public RandomSource {
   public:
    MOCK_METHOD(outcome::result<void>, fill, (qtils::BytesOut), (override));
  };

}  // namespace lamport::crypto
