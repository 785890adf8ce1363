#pragma once
#include <stdexcept>

namespace farfalle {

// Key empty or too long for the chosen instance.
class InvalidKeyError : public std::invalid_argument {
public:
  using std::invalid_argument::invalid_argument;
};

// Requested output length negative or above the configured maximum.
class InvalidLengthError : public std::invalid_argument {
public:
  using std::invalid_argument::invalid_argument;
};

// Absorb or finalize on an instance that was already finalized.
class FinalizedError : public std::logic_error {
public:
  using std::logic_error::logic_error;
};

} // namespace farfalle
