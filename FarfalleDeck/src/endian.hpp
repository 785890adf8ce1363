#pragma once
#include <cstdint>
#include <cstddef>

namespace farfalle::endian {

// Byte i (little endian) of a lane.
template <typename Word>
inline std::uint8_t word_byte(Word w, std::size_t i) {
  return (std::uint8_t)((w >> (8U * i)) & 0xFF);
}

template <typename Word>
inline Word byte_word(std::uint8_t b, std::size_t i) {
  return (Word)((Word)b << (8U * i));
}

static inline std::uint32_t rotl32(std::uint32_t x, unsigned n) {
  return n == 0 ? x : (x << n) | (x >> (32U - n));
}

static inline std::uint64_t rotl64(std::uint64_t x, unsigned n) {
  return n == 0 ? x : (x << n) | (x >> (64U - n));
}

} // namespace farfalle::endian
