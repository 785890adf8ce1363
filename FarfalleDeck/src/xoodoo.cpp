#include "xoodoo.hpp"
#include "endian.hpp"

#include <stdexcept>

namespace farfalle {

static constexpr std::uint32_t RC[XOODOO_MAX_ROUNDS] = {
  0x00000058, 0x00000038, 0x000003C0, 0x000000D0,
  0x00000120, 0x00000014, 0x00000060, 0x0000002C,
  0x00000380, 0x000000F0, 0x000001A0, 0x00000012
};

void xoodoo(XoodooState& st, unsigned rounds) {
  if (rounds == 0 || rounds > XOODOO_MAX_ROUNDS) {
    throw std::invalid_argument("xoodoo: rounds must be in 1..12");
  }

  auto& a = st.lanes();
  std::uint32_t* A0 = a.data();
  std::uint32_t* A1 = a.data() + 4;
  std::uint32_t* A2 = a.data() + 8;

  for (unsigned round = XOODOO_MAX_ROUNDS - rounds; round < XOODOO_MAX_ROUNDS; ++round) {
    // theta
    std::uint32_t P[4], E[4];
    for (int x = 0; x < 4; ++x) P[x] = A0[x] ^ A1[x] ^ A2[x];
    for (int x = 0; x < 4; ++x) {
      const std::uint32_t p = P[(x + 3) % 4];
      E[x] = endian::rotl32(p, 5) ^ endian::rotl32(p, 14);
    }
    for (int x = 0; x < 4; ++x) {
      A0[x] ^= E[x];
      A1[x] ^= E[x];
      A2[x] ^= E[x];
    }

    // rho-west
    const std::uint32_t a13 = A1[3];
    A1[3] = A1[2];
    A1[2] = A1[1];
    A1[1] = A1[0];
    A1[0] = a13;
    for (int x = 0; x < 4; ++x) A2[x] = endian::rotl32(A2[x], 11);

    // iota
    A0[0] ^= RC[round];

    // chi
    for (int x = 0; x < 4; ++x) {
      const std::uint32_t b0 = ~A1[x] & A2[x];
      const std::uint32_t b1 = ~A2[x] & A0[x];
      const std::uint32_t b2 = ~A0[x] & A1[x];
      A0[x] ^= b0;
      A1[x] ^= b1;
      A2[x] ^= b2;
    }

    // rho-east
    for (int x = 0; x < 4; ++x) A1[x] = endian::rotl32(A1[x], 1);
    const std::uint32_t a20 = A2[0], a21 = A2[1];
    A2[0] = endian::rotl32(A2[2], 8);
    A2[1] = endian::rotl32(A2[3], 8);
    A2[2] = endian::rotl32(a20, 8);
    A2[3] = endian::rotl32(a21, 8);
  }
}

} // namespace farfalle
