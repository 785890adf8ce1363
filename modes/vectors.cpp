#include "modes.hpp"

#include "../core/defs.hpp"
#include "../core/testcases.hpp"

#include "farfalle/errors.hpp"

#include <iostream>

namespace kravgen::modes {

static const char* VECTORS_USAGE = "Usage: kravgen vectors [--key <text>] [--check]";

Status vectors_cmd(const Args& args) {
  std::string key = DEFAULT_KEY;
  bool check = false;

  for (std::size_t i = 0; i < args.size(); ++i) {
    if (args[i] == "--key" && i + 1 < args.size()) {
      key = args[i + 1];
      ++i;
    } else if (args[i] == "--check") {
      check = true;
    } else {
      return Status::err(ExitCode::Usage, std::string("vectors: unexpected argument '") + args[i] + "'\n" + VECTORS_USAGE);
    }
  }

  if (check && key != DEFAULT_KEY) {
    return Status::err(ExitCode::Usage, "vectors: --check only applies to the default key");
  }

  std::string mismatched;
  for (const auto& tc : testcases::builtin()) {
    std::vector<std::uint8_t> digest;
    try {
      digest = testcases::generate(key, tc);
    } catch (const farfalle::InvalidKeyError& e) {
      return Status::err(ExitCode::CryptoError, std::string("vectors: ") + e.what());
    }

    std::cout << testcases::render(tc.number, digest);

    if (check && digest != tc.expected) {
      if (!mismatched.empty()) mismatched += ", ";
      mismatched += std::to_string(tc.number);
    }
  }

  if (!mismatched.empty()) {
    return Status::err(ExitCode::IntegrityError, "vectors: known-answer mismatch in testcase " + mismatched);
  }
  return Status::ok();
}

} // namespace kravgen::modes
