/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include <map>
#include <string>

#include <qtils/bytestr.hpp>

#include "ots/digest.hpp"

namespace testutil {

  /**
   * One byte digest with predictable output, B = 8.
   * Single bytes map through the bijection `b * 37 + 11`, so distinct
   * preimages have distinct images. Messages listed in `fixed` hash to the
   * given value, other messages to a polynomial fold of their bytes.
   * Not a cryptographic hash.
   */
  class ToyDigest : public lamport::ots::Digest {
   public:
    explicit ToyDigest(std::map<std::string, uint8_t> fixed = {
                           {"hello", 0b10110010},
                       })
        : fixed_{std::move(fixed)} {}

    size_t size() const override {
      return 1;
    }

    qtils::ByteVec digest(qtils::BytesIn data) const override {
      if (data.size() == 1) {
        return qtils::ByteVec(1, static_cast<uint8_t>(data[0] * 37 + 11));
      }
      auto it = fixed_.find(std::string{qtils::byte2str(data)});
      if (it != fixed_.end()) {
        return qtils::ByteVec(1, it->second);
      }
      uint8_t hash = 0;
      for (auto byte : data) {
        hash = static_cast<uint8_t>(hash * 31 + byte);
      }
      return qtils::ByteVec(1, hash);
    }

   private:
    std::map<std::string, uint8_t> fixed_;
  };

  /// Digest declaring zero output bytes, B = 0
  class EmptyDigest : public ToyDigest {
   public:
    size_t size() const override {
      return 0;
    }

    qtils::ByteVec digest(qtils::BytesIn) const override {
      return {};
    }
  };

}  // namespace testutil
