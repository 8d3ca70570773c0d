/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include <boost/random/random_device.hpp>

#include "crypto/random/random_source.hpp"

namespace lamport::crypto {

  /**
   * Random source backed by `boost::random::random_device`, which reads
   * the operating system entropy device.
   * Not thread safe.
   */
  class BoostRandomSource : public RandomSource {
   public:
    outcome::result<void> fill(qtils::BytesOut out) override;

   private:
    boost::random::random_device device_;
  };

}  // namespace lamport::crypto
