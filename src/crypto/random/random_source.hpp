/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include <qtils/bytes.hpp>
#include <qtils/enum_error_code.hpp>
#include <qtils/outcome.hpp>

namespace lamport::crypto {

  enum class RandomError : uint8_t {
    EXHAUSTED = 1,
  };

  /**
   * Source of cryptographically secure random bytes.
   */
  class RandomSource {
   public:
    virtual ~RandomSource() = default;

    /**
     * Fills the whole of `out` with random bytes.
     * @return RandomError::EXHAUSTED if the underlying generator could not
     * supply them; `out` content is unspecified in that case
     */
    virtual outcome::result<void> fill(qtils::BytesOut out) = 0;
  };

}  // namespace lamport::crypto

OUTCOME_HPP_DECLARE_ERROR(lamport::crypto, RandomError);
