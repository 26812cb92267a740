#include "lowercase_rune_reader.hpp"

#include <stdexcept>
#include <utility>

LowercaseRuneReader::LowercaseRuneReader(std::unique_ptr<IRuneReader> inner)
    : inner_(std::move(inner)) {
  if (!inner_)
    throw std::invalid_argument("LowercaseRuneReader needs a reader to wrap");
}

std::optional<Utils::DecodedRune> LowercaseRuneReader::read_rune() {
  auto decoded = inner_->read_rune();
  if (decoded)
    decoded->rune = Utils::to_lower_rune(decoded->rune);
  return decoded;
}

bool LowercaseRuneReader::has_error() const { return inner_->has_error(); }

void LowercaseRuneReader::interrupt() { inner_->interrupt(); }
