/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include <blake2.h>
#include <qtils/byte_arr.hpp>
#include <qtils/bytes.hpp>

namespace lamport::crypto {
  /**
   * Unkeyed BLAKE2b with `N` bytes of output.
   */
  template <size_t N>
    requires(N > 0 and N <= BLAKE2B_OUTBYTES)
  struct Blake2b {
    using Hash = qtils::ByteArr<N>;
    blake2b_state state;
    Blake2b() {
      blake2b_init(&state, N);
    }
    Blake2b &update(qtils::BytesIn input) {
      blake2b_update(&state, input.data(), input.size());
      return *this;
    }
    Hash hash() const {
      Hash hash;
      auto state2 = state;
      blake2b_final(&state2, hash.data(), N);
      return hash;
    }
    static Hash hash(qtils::BytesIn input) {
      return Blake2b{}.update(input).hash();
    }
  };
}  // namespace lamport::crypto
