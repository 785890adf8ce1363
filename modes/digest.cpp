#include "modes.hpp"

#include "../core/defs.hpp"
#include "../core/input.hpp"

#include "farfalle/deck.hpp"
#include "farfalle/util.hpp"

#include <iostream>
#include <span>
#include <utility>

namespace kravgen::modes {

static const char* DIGEST_USAGE =
  "Usage: kravgen digest [--key <text> | --key-hex <hex>] [--part <text>]... [--part-file <path>]...\n"
  "                      [--out-bytes N] [--format list|hex] [--instance kravatte|xoofff]";

enum class Format { List, Hex };

Status digest_cmd(const Args& args) {
  std::vector<std::uint8_t> key = farfalle::to_bytes(DEFAULT_KEY);
  std::vector<std::vector<std::uint8_t>> parts;
  std::int64_t out_bytes = DEFAULT_OUT_BYTES;
  Format format = Format::List;
  farfalle::PrfParams params;

  for (std::size_t i = 0; i < args.size(); ++i) {
    const std::string& a = args[i];
    const bool has_val = i + 1 < args.size();

    if (a == "--key" && has_val) {
      key = farfalle::to_bytes(args[++i]);
    } else if (a == "--key-hex" && has_val) {
      try {
        key = farfalle::from_hex(args[++i]);
      } catch (const std::invalid_argument& e) {
        return Status::err(ExitCode::Usage, std::string("digest: --key-hex: ") + e.what());
      }
    } else if (a == "--part" && has_val) {
      parts.push_back(farfalle::to_bytes(args[++i]));
    } else if (a == "--part-file" && has_val) {
      std::vector<std::uint8_t> data;
      auto st = input::read_file(args[++i], data);
      if (!st.is_ok()) return st;
      parts.push_back(std::move(data));
    } else if (a == "--out-bytes" && has_val) {
      if (!input::parse_int64(args[++i], out_bytes)) {
        return Status::err(ExitCode::Usage, "digest: --out-bytes must be an integer");
      }
    } else if (a == "--format" && has_val) {
      const std::string& f = args[++i];
      if (f == "list") format = Format::List;
      else if (f == "hex") format = Format::Hex;
      else return Status::err(ExitCode::Usage, "digest: --format must be 'list' or 'hex'");
    } else if (a == "--instance" && has_val) {
      try {
        params.instance = farfalle::parse_instance(args[++i]);
      } catch (const std::invalid_argument& e) {
        return Status::err(ExitCode::Usage, std::string("digest: ") + e.what());
      }
    } else {
      return Status::err(ExitCode::Usage, "digest: unexpected argument '" + a + "'\n" + DIGEST_USAGE);
    }
  }

  std::vector<std::uint8_t> out;
  try {
    farfalle::KeyedSpongePRF prf(key, params);
    for (const auto& p : parts) prf.absorb(p);
    out = prf.finalize_and_squeeze(out_bytes);
  } catch (const farfalle::InvalidKeyError& e) {
    return Status::err(ExitCode::CryptoError, std::string("digest: ") + e.what());
  } catch (const farfalle::InvalidLengthError& e) {
    return Status::err(ExitCode::CryptoError, std::string("digest: ") + e.what());
  }

  if (format == Format::List) std::cout << farfalle::hex_list(out) << "\n";
  else std::cout << farfalle::hex_lower(out) << "\n";

  return Status::ok();
}

} // namespace kravgen::modes
