#pragma once
#include <array>
#include <cstddef>
#include <cstdint>
#include <span>
#include <stdexcept>

#include "endian.hpp"

namespace farfalle {

// Permutation state made of little-endian lanes. Byte i of the state is
// byte (i % sizeof(Word)) of lane (i / sizeof(Word)).
template <typename Word, std::size_t Words>
class PermutationState {
public:
  using word_type = Word;

  static constexpr std::size_t LANES = Words;
  static constexpr std::size_t WORD_BYTES = sizeof(Word);
  static constexpr std::size_t SIZE = Words * sizeof(Word);

  std::array<Word, Words>& lanes() { return a_; }
  const std::array<Word, Words>& lanes() const { return a_; }

  void write_bytes(std::size_t offset, std::span<const std::uint8_t> data) {
    check_range(offset, data.size());
    for (std::size_t i = 0; i < data.size(); ++i) {
      const std::size_t pos = offset + i;
      const std::size_t li = pos / WORD_BYTES;
      const std::size_t bi = pos % WORD_BYTES;
      a_[li] = (Word)((a_[li] & (Word)~endian::byte_word<Word>(0xFF, bi))
                      | endian::byte_word<Word>(data[i], bi));
    }
  }

  void xor_bytes(std::size_t offset, std::span<const std::uint8_t> data) {
    check_range(offset, data.size());
    for (std::size_t i = 0; i < data.size(); ++i) {
      const std::size_t pos = offset + i;
      a_[pos / WORD_BYTES] ^= endian::byte_word<Word>(data[i], pos % WORD_BYTES);
    }
  }

  void read_bytes(std::size_t offset, std::span<std::uint8_t> out) const {
    check_range(offset, out.size());
    for (std::size_t i = 0; i < out.size(); ++i) {
      const std::size_t pos = offset + i;
      out[i] = endian::word_byte<Word>(a_[pos / WORD_BYTES], pos % WORD_BYTES);
    }
  }

  // Clears every byte from offset to the end of the state.
  void zero_from(std::size_t offset) {
    check_range(offset, 0);
    std::size_t pos = offset;
    while (pos < SIZE && (pos % WORD_BYTES) != 0) {
      a_[pos / WORD_BYTES] &= (Word)~endian::byte_word<Word>(0xFF, pos % WORD_BYTES);
      ++pos;
    }
    for (std::size_t li = pos / WORD_BYTES; li < Words; ++li) a_[li] = 0;
  }

  void wipe() {
    volatile Word* v = a_.data();
    for (std::size_t i = 0; i < Words; ++i) v[i] = 0;
  }

  PermutationState& operator^=(const PermutationState& rhs) {
    for (std::size_t i = 0; i < Words; ++i) a_[i] ^= rhs.a_[i];
    return *this;
  }

  bool operator==(const PermutationState& rhs) const = default;

private:
  static void check_range(std::size_t offset, std::size_t len) {
    if (offset > SIZE || len > SIZE - offset) {
      throw std::out_of_range("permutation state: access beyond state size");
    }
  }

  std::array<Word, Words> a_{};
};

// Keccak-p[1600]: 25 64-bit lanes, lane (x, y) at index x + 5*y.
using KeccakState1600 = PermutationState<std::uint64_t, 25>;

// Xoodoo: 12 32-bit lanes, lane (x, y) at index x + 4*y.
using XoodooState = PermutationState<std::uint32_t, 12>;

} // namespace farfalle
