#include "farfalle/deck.hpp"
#include "farfalle/util.hpp"
#include "instances.hpp"

#include <optional>
#include <string>
#include <variant>

namespace farfalle {

using Deck = std::variant<Kravatte, Xoofff>;
using Generator = std::variant<Kravatte::OutputGenerator, Xoofff::OutputGenerator>;

std::string_view instance_name(Instance inst) {
  switch (inst) {
    case Instance::Kravatte: return KravatteConfig::NAME;
    case Instance::Xoofff:   return XoofffConfig::NAME;
  }
  return "unknown";
}

Instance parse_instance(std::string_view name) {
  if (name == "kravatte") return Instance::Kravatte;
  if (name == "xoofff") return Instance::Xoofff;
  throw std::invalid_argument("unknown instance: " + std::string(name));
}

static Deck make_deck(Instance inst, std::span<const std::uint8_t> key) {
  switch (inst) {
    case Instance::Kravatte: return Deck(std::in_place_type<Kravatte>, key);
    case Instance::Xoofff:   return Deck(std::in_place_type<Xoofff>, key);
  }
  throw std::invalid_argument("unknown instance");
}

static std::size_t checked_length(std::int64_t n, std::int64_t max) {
  if (n < 0) {
    throw InvalidLengthError("output length must be non-negative, got " + std::to_string(n));
  }
  if (n > max) {
    throw InvalidLengthError("output length " + std::to_string(n)
                             + " exceeds maximum of " + std::to_string(max) + " bytes");
  }
  return static_cast<std::size_t>(n);
}

struct KeyedSpongePRF::Impl {
  Impl(std::span<const std::uint8_t> key, const PrfParams& p)
    : params(p), deck(make_deck(p.instance, key)) {}

  std::vector<std::uint8_t> read(std::size_t n) {
    std::vector<std::uint8_t> out(n);
    std::visit([&](auto& g) { g.read(std::span<std::uint8_t>(out)); }, *gen);
    return out;
  }

  PrfParams params;
  Deck deck;
  std::optional<Generator> gen;
  PrfState state = PrfState::Keyed;
};

std::size_t KeyedSpongePRF::max_key_bytes(Instance inst) {
  switch (inst) {
    case Instance::Kravatte: return Kravatte::MAX_KEY_BYTES;
    case Instance::Xoofff:   return Xoofff::MAX_KEY_BYTES;
  }
  return 0;
}

KeyedSpongePRF::KeyedSpongePRF(std::span<const std::uint8_t> key, const PrfParams& params) {
  require(params.max_out_bytes >= 0, "max_out_bytes must be >= 0");
  if (key.empty()) {
    throw InvalidKeyError(std::string(instance_name(params.instance)) + ": key must not be empty");
  }
  const std::size_t max_key = max_key_bytes(params.instance);
  if (key.size() > max_key) {
    throw InvalidKeyError(std::string(instance_name(params.instance)) + ": key is "
                          + std::to_string(key.size()) + " bytes, maximum is "
                          + std::to_string(max_key));
  }
  impl_ = std::make_unique<Impl>(key, params);
}

KeyedSpongePRF::~KeyedSpongePRF() = default;
KeyedSpongePRF::KeyedSpongePRF(KeyedSpongePRF&&) noexcept = default;
KeyedSpongePRF& KeyedSpongePRF::operator=(KeyedSpongePRF&&) noexcept = default;

void KeyedSpongePRF::absorb(std::span<const std::uint8_t> part) {
  if (impl_->state == PrfState::Finalized) {
    throw FinalizedError("absorb after finalize_and_squeeze");
  }
  std::visit([&](auto& d) { d.absorb(part); }, impl_->deck);
  impl_->state = PrfState::Absorbing;
}

void KeyedSpongePRF::absorb_concat(const std::vector<std::span<const std::uint8_t>>& pieces) {
  if (impl_->state == PrfState::Finalized) {
    throw FinalizedError("absorb after finalize_and_squeeze");
  }
  std::visit([&](auto& d) {
    auto w = d.input_writer();
    for (const auto& p : pieces) w.write(p);
    w.finish();
  }, impl_->deck);
  impl_->state = PrfState::Absorbing;
}

std::vector<std::uint8_t> KeyedSpongePRF::finalize_and_squeeze(std::int64_t out_len) {
  if (impl_->state == PrfState::Finalized) {
    throw FinalizedError("finalize_and_squeeze called twice");
  }
  const std::size_t n = checked_length(out_len, impl_->params.max_out_bytes);

  impl_->gen.emplace(std::visit(
      [](const auto& d) -> Generator { return d.output_reader(); }, impl_->deck));
  impl_->state = PrfState::Finalized;
  return impl_->read(n);
}

std::vector<std::uint8_t> KeyedSpongePRF::squeeze(std::int64_t out_len) {
  if (impl_->state != PrfState::Finalized) {
    throw std::logic_error("squeeze before finalize_and_squeeze");
  }
  return impl_->read(checked_length(out_len, impl_->params.max_out_bytes));
}

PrfState KeyedSpongePRF::state() const { return impl_->state; }

Instance KeyedSpongePRF::instance() const { return impl_->params.instance; }

std::vector<std::uint8_t> deck_digest(
    std::span<const std::uint8_t> key,
    const std::vector<std::span<const std::uint8_t>>& parts,
    std::int64_t out_len,
    const PrfParams& params)
{
  KeyedSpongePRF prf(key, params);
  for (const auto& part : parts) prf.absorb(part);
  return prf.finalize_and_squeeze(out_len);
}

} // namespace farfalle
