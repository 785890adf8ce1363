#pragma once
#include "state.hpp"

namespace farfalle {

inline constexpr unsigned XOODOO_MAX_ROUNDS = 12;

// Xoodoo with the last `rounds` of its 12 round constants.
// Throws std::invalid_argument unless 1 <= rounds <= 12.
void xoodoo(XoodooState& st, unsigned rounds);

} // namespace farfalle
