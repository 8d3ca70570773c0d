/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#include "crypto/random/boost_random_source.hpp"

#include <algorithm>
#include <cstring>

#include <boost/system/system_error.hpp>

namespace lamport::crypto {

  outcome::result<void> BoostRandomSource::fill(qtils::BytesOut out) {
    using Word = boost::random::random_device::result_type;
    try {
      for (size_t offset = 0; offset < out.size(); offset += sizeof(Word)) {
        Word word = device_();
        auto n = std::min(sizeof(Word), out.size() - offset);
        std::memcpy(out.data() + offset, &word, n);
      }
    } catch (const boost::system::system_error &) {
      return RandomError::EXHAUSTED;
    }
    return outcome::success();
  }

}  // namespace lamport::crypto
