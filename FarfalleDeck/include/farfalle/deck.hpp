#pragma once
#include <cstddef>
#include <cstdint>
#include <memory>
#include <span>
#include <string_view>
#include <vector>

#include "farfalle/errors.hpp"

namespace farfalle {

enum class Instance : std::uint8_t { Kravatte = 0, Xoofff = 1 };

inline constexpr std::int64_t DEFAULT_MAX_OUT_BYTES = std::int64_t{1} << 32;

struct PrfParams {
  Instance instance = Instance::Kravatte;
  std::int64_t max_out_bytes = DEFAULT_MAX_OUT_BYTES;
};

enum class PrfState : std::uint8_t { Keyed, Absorbing, Finalized };

std::string_view instance_name(Instance inst);

// Accepts "kravatte" or "xoofff" (case sensitive). Throws
// std::invalid_argument otherwise.
Instance parse_instance(std::string_view name);

/**
 * Keyed pseudorandom function over an ordered list of message parts.
 *
 * Each absorb() call is one Farfalle input string, so ["hello", "world"]
 * and ["helloworld"] give different digests. finalize_and_squeeze() may be
 * called once; squeeze() then continues the same output stream.
 *
 * Not synchronised: use one instance per thread.
 */
class KeyedSpongePRF {
public:
  // Throws InvalidKeyError if the key is empty or longer than
  // max_key_bytes(params.instance).
  explicit KeyedSpongePRF(std::span<const std::uint8_t> key, const PrfParams& params = {});
  ~KeyedSpongePRF();

  KeyedSpongePRF(KeyedSpongePRF&&) noexcept;
  KeyedSpongePRF& operator=(KeyedSpongePRF&&) noexcept;
  KeyedSpongePRF(const KeyedSpongePRF&) = delete;
  KeyedSpongePRF& operator=(const KeyedSpongePRF&) = delete;

  void absorb(std::span<const std::uint8_t> part);

  // One part made of the concatenation of `pieces`.
  void absorb_concat(const std::vector<std::span<const std::uint8_t>>& pieces);

  // Throws InvalidLengthError if out_len < 0 or out_len > max_out_bytes,
  // FinalizedError on a second call.
  std::vector<std::uint8_t> finalize_and_squeeze(std::int64_t out_len);

  // Next out_len bytes of the stream started by finalize_and_squeeze().
  std::vector<std::uint8_t> squeeze(std::int64_t out_len);

  PrfState state() const;
  Instance instance() const;

  static std::size_t max_key_bytes(Instance inst);

private:
  struct Impl;
  std::unique_ptr<Impl> impl_;
};

std::vector<std::uint8_t> deck_digest(
    std::span<const std::uint8_t> key,
    const std::vector<std::span<const std::uint8_t>>& parts,
    std::int64_t out_len,
    const PrfParams& params = {}
);

} // namespace farfalle
