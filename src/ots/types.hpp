/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include <cstddef>
#include <functional>
#include <utility>

#include <boost/assert.hpp>
#include <qtils/byte_vec.hpp>
#include <qtils/bytes.hpp>
#include <qtils/bytes_std_hash.hpp>

#include "utils/ctor_limiters.hpp"

namespace lamport::ots {

  /**
   * Flat storage of `count` byte strings of `chunkSize` bytes each.
   * Entry `k` occupies bytes `[k * chunkSize, (k + 1) * chunkSize)`.
   */
  class ChunkSequence {
   public:
    ChunkSequence() = default;

    /// Zero-filled sequence
    ChunkSequence(size_t count, size_t chunk_size)
        : bytes_(count * chunk_size), chunk_size_{chunk_size} {}

    /// `bytes.size()` must be a multiple of `chunk_size`
    ChunkSequence(qtils::ByteVec bytes, size_t chunk_size)
        : bytes_(std::move(bytes)), chunk_size_{chunk_size} {
      BOOST_ASSERT(chunk_size_ != 0 and bytes_.size() % chunk_size_ == 0);
    }

    size_t count() const {
      return chunk_size_ == 0 ? 0 : bytes_.size() / chunk_size_;
    }

    size_t chunkSize() const {
      return chunk_size_;
    }

    bool empty() const {
      return bytes_.empty();
    }

    qtils::BytesIn at(size_t index) const {
      BOOST_ASSERT(index < count());
      return qtils::BytesIn{bytes_}.subspan(index * chunk_size_, chunk_size_);
    }

    qtils::BytesOut at(size_t index) {
      BOOST_ASSERT(index < count());
      return qtils::BytesOut{bytes_}.subspan(index * chunk_size_, chunk_size_);
    }

    const qtils::ByteVec &bytes() const {
      return bytes_;
    }

    qtils::BytesOut mutableBytes() {
      return bytes_;
    }

    /// Overwrites the content with zeros and leaves the sequence empty
    void wipe();

    bool operator==(const ChunkSequence &other) const = default;

   private:
    qtils::ByteVec bytes_;
    size_t chunk_size_ = 0;
  };

  /**
   * Index of the preimage (or its hash) selected by bit `bit` at digest
   * position `position`.
   */
  inline size_t pairIndex(size_t position, bool bit) {
    return 2 * position + (bit ? 1 : 0);
  }

  /**
   * `2 * B` secret preimages, pair `i` stored at `2 * i` and `2 * i + 1`.
   * Move-only. A moved-from key is empty, which is the consumed state; the
   * secret bytes are wiped on destruction and on move.
   */
  class PrivateKey : NonCopyable {
   public:
    PrivateKey() = default;
    explicit PrivateKey(ChunkSequence preimages)
        : preimages_{std::move(preimages)} {}

    PrivateKey(PrivateKey &&other) noexcept
        : preimages_{std::exchange(other.preimages_, {})} {}

    PrivateKey &operator=(PrivateKey &&other) noexcept {
      if (this != &other) {
        preimages_.wipe();
        preimages_ = std::exchange(other.preimages_, {});
      }
      return *this;
    }

    ~PrivateKey() {
      preimages_.wipe();
    }

    [[nodiscard]] bool consumed() const {
      return preimages_.empty();
    }

    const ChunkSequence &preimages() const {
      return preimages_;
    }

    qtils::BytesIn preimage(size_t position, bool bit) const {
      return preimages_.at(pairIndex(position, bit));
    }

   private:
    ChunkSequence preimages_;
  };

  /**
   * `2 * B` hashes of the private preimages, same layout as PrivateKey.
   */
  struct PublicKey {
    ChunkSequence hashes;

    size_t size() const {
      return hashes.count();
    }

    qtils::BytesIn hash(size_t position, bool bit) const {
      return hashes.at(pairIndex(position, bit));
    }

    bool operator==(const PublicKey &other) const = default;
  };

  /**
   * `B` revealed preimages, entry `i` for digest bit `i`.
   */
  struct Signature {
    ChunkSequence preimages;

    size_t size() const {
      return preimages.count();
    }

    bool operator==(const Signature &other) const = default;
  };

  struct Keypair {
    PrivateKey private_key;
    PublicKey public_key;
  };

}  // namespace lamport::ots

template <>
struct std::hash<lamport::ots::PublicKey> {
  size_t operator()(const lamport::ots::PublicKey &public_key) const {
    return qtils::BytesStdHash{}(public_key.hashes.bytes());
  }
};
