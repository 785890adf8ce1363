#pragma once
#include "state.hpp"

namespace farfalle {

inline constexpr unsigned KECCAK_MAX_ROUNDS = 24;

// Keccak-p[1600, rounds]: the last `rounds` rounds of Keccak-f[1600].
// Throws std::invalid_argument unless 1 <= rounds <= 24.
void keccak_p1600(KeccakState1600& st, unsigned rounds);

inline void keccak_f1600(KeccakState1600& st) { keccak_p1600(st, KECCAK_MAX_ROUNDS); }

} // namespace farfalle
