#include "input.hpp"

#include <cerrno>
#include <cstdlib>
#include <fstream>
#include <iterator>

namespace kravgen::input {

Status read_file(const std::string& path, std::vector<std::uint8_t>& out) {
  std::ifstream f(path, std::ios::binary);
  if (!f) {
    return Status::err(ExitCode::IoError, "cannot open part file: " + path);
  }
  out.assign((std::istreambuf_iterator<char>(f)), std::istreambuf_iterator<char>());
  if (f.bad()) {
    return Status::err(ExitCode::IoError, "error reading part file: " + path);
  }
  return Status::ok();
}

bool parse_int64(const std::string& s, std::int64_t& out) {
  if (s.empty()) return false;
  errno = 0;
  char* end = nullptr;
  const long long v = std::strtoll(s.c_str(), &end, 10);
  if (end == s.c_str() || *end != '\0' || errno == ERANGE) return false;
  out = static_cast<std::int64_t>(v);
  return true;
}

} // namespace kravgen::input
