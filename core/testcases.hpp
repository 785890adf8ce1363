#pragma once
#include <cstdint>
#include <string>
#include <vector>

namespace kravgen::testcases {

struct TestCase {
  int number = 0;
  std::vector<std::string> parts;
  std::int64_t out_bytes = 0;
  // Known answer under DEFAULT_KEY.
  std::vector<std::uint8_t> expected;
};

const std::vector<TestCase>& builtin();

std::vector<std::uint8_t> generate(const std::string& key, const TestCase& tc);

// "Testcase <n>:", rule, hex list, rule, blank line.
std::string render(int number, const std::vector<std::uint8_t>& digest);

} // namespace kravgen::testcases
