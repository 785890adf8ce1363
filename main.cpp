#include <exception>
#include <iostream>
#include <string>
#include <vector>

#include "core/defs.hpp"
#include "core/errors.hpp"
#include "modes/modes.hpp"

namespace {

static void print_help() {
  using namespace kravgen;
  std::cout
    << TOOL_NAME << " - Kravatte / Xoofff test vector tool\n\n"
    << "Usage:\n"
    << "  kravgen <command> [args...]\n\n"
    << "Commands:\n"
    << "  vectors [--key K] [--check]      Print the reference test cases\n"
    << "  digest [options]                 Digest of the given parts\n"
    << "      --key K | --key-hex H        Key (default \"" << DEFAULT_KEY << "\")\n"
    << "      --part P                     Absorb P as one part (repeatable, in order)\n"
    << "      --part-file F                Absorb the contents of F as one part\n"
    << "      --out-bytes N                Digest length (default " << DEFAULT_OUT_BYTES << ")\n"
    << "      --format list|hex            Output layout (default list)\n"
    << "      --instance kravatte|xoofff   Deck function (default kravatte)\n\n"
    << "Exit codes:\n"
    << "  2 usage, 10 I/O, 20 invalid key or length, 30 known-answer mismatch\n";
}

static std::vector<std::string> to_args(int argc, char** argv, int start) {
  std::vector<std::string> out;
  for (int i = start; i < argc; ++i) out.emplace_back(argv[i]);
  return out;
}

} // namespace

int main(int argc, char** argv) {
  using namespace kravgen;

  if (argc < 2) {
    print_help();
    return static_cast<int>(ExitCode::Usage);
  }

  const std::string cmd = argv[1];
  const auto args = to_args(argc, argv, 2);

  Status st;

  try {
    if (cmd == "vectors") st = modes::vectors_cmd(args);
    else if (cmd == "digest") st = modes::digest_cmd(args);
    else if (cmd == "-h" || cmd == "--help" || cmd == "help") {
      print_help();
      return static_cast<int>(ExitCode::Ok);
    } else {
      std::cerr << "Unknown command: " << cmd << "\n\n";
      print_help();
      return static_cast<int>(ExitCode::Usage);
    }
  } catch (const std::exception& e) {
    st = Status::err(ExitCode::InternalError, std::string("internal error: ") + e.what());
  }

  if (!st.is_ok()) {
    if (!st.message.empty()) std::cerr << st.message << "\n";
    return static_cast<int>(st.code);
  }
  return static_cast<int>(ExitCode::Ok);
}
