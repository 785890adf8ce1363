#include "instances.hpp"
#include "endian.hpp"

#include <algorithm>

namespace farfalle {

using endian::rotl32;
using endian::rotl64;

// Kravatte rolls a window of the last lanes like an LFSR: the window moves
// one lane towards the start and a new lane is appended.

void KravatteConfig::roll_c(State& s) {
  auto& a = s.lanes();
  // plane y = 4
  const std::uint64_t x0 = a[20];
  const std::uint64_t x1 = a[21];
  const std::uint64_t x5 = rotl64(x0, 7) ^ x1 ^ (x1 >> 3);
  std::copy(a.begin() + 21, a.end(), a.begin() + 20);
  a[24] = x5;
}

void KravatteConfig::roll_e(State& s) {
  auto& a = s.lanes();
  // planes y = 3, 4
  const std::uint64_t x0 = a[15];
  const std::uint64_t x1 = a[16];
  const std::uint64_t x2 = a[17];
  const std::uint64_t x10 = rotl64(x0, 7) ^ rotl64(x1, 18) ^ (x2 & (x1 >> 1));
  std::copy(a.begin() + 16, a.end(), a.begin() + 15);
  a[24] = x10;
}

// Xoofff updates lane (0, 0), then moves planes 1 and 2 down and puts the
// old plane 0, shifted by one lane in x, on top.
static void xoofff_shift_planes(std::array<std::uint32_t, 12>& a) {
  const std::uint32_t p0[4] = {a[1], a[2], a[3], a[0]};
  std::copy(a.begin() + 4, a.end(), a.begin());
  std::copy(p0, p0 + 4, a.begin() + 8);
}

void XoofffConfig::roll_c(State& s) {
  auto& a = s.lanes();
  a[0] ^= (a[0] << 13) ^ rotl32(a[4], 3);
  xoofff_shift_planes(a);
}

void XoofffConfig::roll_e(State& s) {
  auto& a = s.lanes();
  a[0] = (a[4] & a[8]) ^ rotl32(a[0], 5) ^ rotl32(a[4], 13) ^ 0x00000007U;
  xoofff_shift_planes(a);
}

} // namespace farfalle
