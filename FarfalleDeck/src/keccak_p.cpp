#include "keccak_p.hpp"
#include "endian.hpp"

#include <stdexcept>

namespace farfalle {

static constexpr std::uint64_t RC[KECCAK_MAX_ROUNDS] = {
 0x0000000000000001ULL, 0x0000000000008082ULL,
 0x800000000000808aULL, 0x8000000080008000ULL,
 0x000000000000808bULL, 0x0000000080000001ULL,
 0x8000000080008081ULL, 0x8000000000008009ULL,
 0x000000000000008aULL, 0x0000000000000088ULL,
 0x0000000080008009ULL, 0x000000008000000aULL,
 0x000000008000808bULL, 0x800000000000008bULL,
 0x8000000000008089ULL, 0x8000000000008003ULL,
 0x8000000000008002ULL, 0x8000000000000080ULL,
 0x000000000000800aULL, 0x800000008000000aULL,
 0x8000000080008081ULL, 0x8000000000008080ULL,
 0x0000000080000001ULL, 0x8000000080008008ULL
};

// Rotation offsets, indexed x + 5*y.
static constexpr unsigned RHO[25] = {
  0,  1, 62, 28, 27,
 36, 44,  6, 55, 20,
  3, 10, 43, 25, 39,
 41, 45, 15, 21,  8,
 18,  2, 61, 56, 14
};

void keccak_p1600(KeccakState1600& st, unsigned rounds) {
  if (rounds == 0 || rounds > KECCAK_MAX_ROUNDS) {
    throw std::invalid_argument("keccak_p1600: rounds must be in 1..24");
  }

  auto& a = st.lanes();
  std::uint64_t b[25];
  std::uint64_t C[5], D[5];

  for (unsigned round = KECCAK_MAX_ROUNDS - rounds; round < KECCAK_MAX_ROUNDS; ++round) {
    // theta
    for (int x = 0; x < 5; ++x) {
      C[x] = a[x] ^ a[x + 5] ^ a[x + 10] ^ a[x + 15] ^ a[x + 20];
    }
    for (int x = 0; x < 5; ++x) {
      D[x] = C[(x + 4) % 5] ^ endian::rotl64(C[(x + 1) % 5], 1);
    }
    for (int y = 0; y < 5; ++y) {
      for (int x = 0; x < 5; ++x) {
        a[x + 5*y] ^= D[x];
      }
    }

    // rho + pi
    for (int y = 0; y < 5; ++y) {
      for (int x = 0; x < 5; ++x) {
        const int xp = y;
        const int yp = (2*x + 3*y) % 5;
        b[xp + 5*yp] = endian::rotl64(a[x + 5*y], RHO[x + 5*y]);
      }
    }

    // chi
    for (int y = 0; y < 5; ++y) {
      const int y5 = 5*y;
      const std::uint64_t b0 = b[y5 + 0], b1 = b[y5 + 1], b2 = b[y5 + 2], b3 = b[y5 + 3], b4 = b[y5 + 4];
      a[y5 + 0] = b0 ^ ((~b1) & b2);
      a[y5 + 1] = b1 ^ ((~b2) & b3);
      a[y5 + 2] = b2 ^ ((~b3) & b4);
      a[y5 + 3] = b3 ^ ((~b4) & b0);
      a[y5 + 4] = b4 ^ ((~b0) & b1);
    }

    // iota
    a[0] ^= RC[round];
  }
}

} // namespace farfalle
