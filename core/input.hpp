#pragma once
#include <cstdint>
#include <string>
#include <vector>

#include "errors.hpp"

namespace kravgen::input {

Status read_file(const std::string& path, std::vector<std::uint8_t>& out);

// Whole-string signed decimal. Negative values are accepted here and
// rejected by the library with its own error.
bool parse_int64(const std::string& s, std::int64_t& out);

} // namespace kravgen::input
