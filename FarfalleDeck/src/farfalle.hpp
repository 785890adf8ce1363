#pragma once
#include <algorithm>
#include <cstddef>
#include <cstdint>
#include <span>
#include <stdexcept>
#include <string>
#include <vector>

#include "farfalle/errors.hpp"

namespace farfalle {

// Generic Farfalle construction.
//
// Config supplies:
//   using State;                          PermutationState specialisation
//   static constexpr const char* NAME;
//   static void perm_b/perm_c/perm_d/perm_e(State&);
//   static void roll_c/roll_e(State&);
//
// Every input writer adds one input string. Writes into the same writer
// are concatenated; separate writers are domain separated by an extra
// roll of the key mask after each string. Creating an output generator
// does not change the Farfalle object.
template <typename Config>
class Farfalle {
public:
  using State = typename Config::State;

  static constexpr std::size_t BLOCK = State::SIZE;
  static constexpr std::uint8_t PAD_BYTE = 0x01;
  // The key and one padding byte must fit a single block.
  static constexpr std::size_t MAX_KEY_BYTES = BLOCK - 1;

  class InputWriter {
  public:
    InputWriter(const InputWriter&) = delete;
    InputWriter& operator=(const InputWriter&) = delete;
    ~InputWriter() { block_.wipe(); }

    void write(std::span<const std::uint8_t> data) {
      if (finished_) throw std::logic_error("farfalle: write to a finished input writer");
      while (!data.empty()) {
        const std::size_t take = std::min<std::size_t>(BLOCK - filled_, data.size());
        block_.write_bytes(filled_, data.first(take));
        filled_ += take;
        data = data.subspan(take);
        if (filled_ == BLOCK) process_block();
      }
    }

    // Pads (0x01 then zeros) and processes the last block, then rolls the
    // key mask once more.
    void finish() {
      if (finished_) throw std::logic_error("farfalle: input writer finished twice");
      const std::uint8_t pad = PAD_BYTE;
      block_.write_bytes(filled_, std::span<const std::uint8_t>(&pad, 1));
      block_.zero_from(filled_ + 1);
      process_block();
      f_->roll_c_key();
      finished_ = true;
    }

    bool finished() const { return finished_; }

  private:
    friend class Farfalle;
    explicit InputWriter(Farfalle& f) : f_(&f) {}

    void process_block() {
      f_->process_block(block_);
      filled_ = 0;
    }

    Farfalle* f_;
    State block_{};
    std::size_t filled_ = 0;
    bool finished_ = false;
  };

  class OutputGenerator {
  public:
    OutputGenerator(const OutputGenerator&) = default;
    OutputGenerator(OutputGenerator&&) = default;
    OutputGenerator& operator=(const OutputGenerator&) = default;
    OutputGenerator& operator=(OutputGenerator&&) = default;
    ~OutputGenerator() {
      key_.wipe();
      state_.wipe();
      buffer_.wipe();
    }

    void read(std::span<std::uint8_t> out) {
      std::size_t off = 0;
      while (off < out.size()) {
        if (buffered_ == 0) next_block();
        const std::size_t take = std::min<std::size_t>(buffered_, out.size() - off);
        buffer_.read_bytes(BLOCK - buffered_, out.subspan(off, take));
        buffered_ -= take;
        off += take;
      }
    }

    std::vector<std::uint8_t> read(std::size_t n) {
      std::vector<std::uint8_t> out(n);
      read(std::span<std::uint8_t>(out));
      return out;
    }

    void skip(std::size_t n) {
      while (n > 0) {
        if (buffered_ == 0) next_block();
        const std::size_t take = std::min<std::size_t>(buffered_, n);
        buffered_ -= take;
        n -= take;
      }
    }

  private:
    friend class Farfalle;
    OutputGenerator(const State& key, const State& state) : key_(key), state_(state) {}

    void next_block() {
      buffer_ = state_;
      Config::roll_e(state_);
      Config::perm_e(buffer_);
      buffer_ ^= key_;
      buffered_ = BLOCK;
    }

    State key_;
    State state_;
    State buffer_{};
    std::size_t buffered_ = 0;
  };

  explicit Farfalle(std::span<const std::uint8_t> key) {
    if (key.size() > MAX_KEY_BYTES) {
      throw InvalidKeyError(std::string(Config::NAME) + ": key must be at most "
                            + std::to_string(MAX_KEY_BYTES) + " bytes");
    }
    const std::uint8_t pad = PAD_BYTE;
    key_.write_bytes(0, key);
    key_.write_bytes(key.size(), std::span<const std::uint8_t>(&pad, 1));
    Config::perm_b(key_);
  }

  Farfalle(const Farfalle&) = default;
  Farfalle(Farfalle&&) = default;
  Farfalle& operator=(const Farfalle&) = default;
  Farfalle& operator=(Farfalle&&) = default;
  ~Farfalle() {
    key_.wipe();
    acc_.wipe();
  }

  InputWriter input_writer() { return InputWriter(*this); }

  // Inputs one complete string.
  void absorb(std::span<const std::uint8_t> data) {
    InputWriter w = input_writer();
    w.write(data);
    w.finish();
  }

  OutputGenerator output_reader() const {
    State s = acc_;
    Config::perm_d(s);
    OutputGenerator gen(key_, s);
    s.wipe();
    return gen;
  }

  bool operator==(const Farfalle& rhs) const { return key_ == rhs.key_ && acc_ == rhs.acc_; }

private:
  void roll_c_key() { Config::roll_c(key_); }

  void process_block(State& block) {
    block ^= key_;
    roll_c_key();
    Config::perm_c(block);
    acc_ ^= block;
  }

  State key_{};
  State acc_{};
};

} // namespace farfalle
