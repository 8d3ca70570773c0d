/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include "crypto/random/random_source.hpp"

namespace lamport::crypto {

  /**
   * Random source backed by the OpenSSL CSPRNG (`RAND_bytes`).
   */
  class OpensslRandomSource : public RandomSource {
   public:
    outcome::result<void> fill(qtils::BytesOut out) override;
  };

}  // namespace lamport::crypto
