#include "testcases.hpp"
#include "defs.hpp"

#include "farfalle/deck.hpp"
#include "farfalle/util.hpp"

#include <span>
#include <sstream>

namespace kravgen::testcases {

static const std::vector<std::uint8_t> HELLO_WORLD_128 = {
  0x04, 0x54, 0x69, 0x85, 0xc4, 0xc7, 0x41, 0x5e, 0xe3, 0x56, 0x76, 0x24, 0xbf, 0x05, 0xa1, 0x53,
  0x35, 0x1a, 0x57, 0x1b, 0xe2, 0x9e, 0x23, 0x26, 0xd3, 0xa0, 0x85, 0x75, 0x01, 0x42, 0xba, 0xb0,
  0x2a, 0xe7, 0x5a, 0x93, 0x35, 0x91, 0x60, 0x95, 0x19, 0x00, 0x0d, 0xea, 0xc1, 0x45, 0x78, 0x13,
  0x8d, 0x9a, 0xee, 0xd0, 0xf5, 0x5c, 0x56, 0x23, 0xe7, 0xb9, 0x64, 0x45, 0x6e, 0x53, 0xf9, 0x09,
  0x0f, 0xe3, 0x85, 0xe8, 0x28, 0x90, 0x55, 0x21, 0x5b, 0xf8, 0xfc, 0x9a, 0x0e, 0x42, 0x71, 0xa8,
  0x26, 0x5e, 0xe0, 0xd6, 0xde, 0xf1, 0x17, 0xb1, 0x2d, 0xa4, 0x68, 0xb9, 0xba, 0x06, 0x83, 0xcb,
  0x78, 0x69, 0xeb, 0x1c, 0xf4, 0x0b, 0x71, 0xd0, 0x81, 0xb9, 0x8f, 0xa1, 0x14, 0xe9, 0x27, 0xfd,
  0xfa, 0x31, 0x9b, 0xa0, 0x46, 0x90, 0x58, 0xac, 0xa8, 0xaa, 0x11, 0x34, 0xf4, 0x30, 0x4c, 0xe1,
};

static const std::vector<std::uint8_t> HELLO_THEN_WORLD_32 = {
  0x36, 0x3e, 0x03, 0x73, 0xff, 0x47, 0x22, 0x1b, 0x63, 0x47, 0xe6, 0x87, 0x9b, 0x9a, 0x5d, 0x24,
  0x2e, 0xcd, 0x6c, 0xde, 0xcb, 0x0a, 0x43, 0x12, 0x45, 0xa2, 0xe3, 0x56, 0x5f, 0x1a, 0xf7, 0xb9,
};

const std::vector<TestCase>& builtin() {
  static const std::vector<TestCase> cases = {
    {1, {"hello world"}, 32,
     std::vector<std::uint8_t>(HELLO_WORLD_128.begin(), HELLO_WORLD_128.begin() + 32)},
    {2, {"hello", "world"}, 32, HELLO_THEN_WORLD_32},
    {3, {"hello world"}, 4 * 32, HELLO_WORLD_128},
  };
  return cases;
}

std::vector<std::uint8_t> generate(const std::string& key, const TestCase& tc) {
  std::vector<std::span<const std::uint8_t>> parts;
  parts.reserve(tc.parts.size());
  for (const auto& p : tc.parts) parts.push_back(farfalle::as_bytes(p));
  return farfalle::deck_digest(farfalle::as_bytes(key), parts, tc.out_bytes);
}

std::string render(int number, const std::vector<std::uint8_t>& digest) {
  std::ostringstream ss;
  ss << "Testcase " << number << ":\n";
  ss << RULE << "\n";
  ss << farfalle::hex_list(digest) << "\n";
  ss << RULE << "\n";
  ss << "\n";
  return ss.str();
}

} // namespace kravgen::testcases
