#pragma once
#include "farfalle.hpp"
#include "keccak_p.hpp"
#include "xoodoo.hpp"

namespace farfalle {

// Kravatte (Achouffe): Farfalle over Keccak-p[1600, 6].
struct KravatteConfig {
  using State = KeccakState1600;
  static constexpr const char* NAME = "Kravatte";
  static constexpr unsigned ROUNDS = 6;

  static void perm_b(State& s) { keccak_p1600(s, ROUNDS); }
  static void perm_c(State& s) { keccak_p1600(s, ROUNDS); }
  static void perm_d(State& s) { keccak_p1600(s, ROUNDS); }
  static void perm_e(State& s) { keccak_p1600(s, ROUNDS); }
  static void roll_c(State& s);
  static void roll_e(State& s);
};

// Xoofff: Farfalle over Xoodoo[6].
struct XoofffConfig {
  using State = XoodooState;
  static constexpr const char* NAME = "Xoofff";
  static constexpr unsigned ROUNDS = 6;

  static void perm_b(State& s) { xoodoo(s, ROUNDS); }
  static void perm_c(State& s) { xoodoo(s, ROUNDS); }
  static void perm_d(State& s) { xoodoo(s, ROUNDS); }
  static void perm_e(State& s) { xoodoo(s, ROUNDS); }
  static void roll_c(State& s);
  static void roll_e(State& s);
};

using Kravatte = Farfalle<KravatteConfig>;
using Xoofff = Farfalle<XoofffConfig>;

} // namespace farfalle
