#ifndef LOWERCASE_RUNE_READER_HPP
#define LOWERCASE_RUNE_READER_HPP

#include "base_rune_reader.hpp"

#include <memory>

// Folds every code point of the wrapped reader to lower case. Encoded widths
// are those of the original input, so match offsets still index the raw text
class LowercaseRuneReader : public IRuneReader {
public:
  explicit LowercaseRuneReader(std::unique_ptr<IRuneReader> inner);

  std::optional<Utils::DecodedRune> read_rune() override;
  bool has_error() const override;
  void interrupt() override;

private:
  std::unique_ptr<IRuneReader> inner_;
};

#endif // LOWERCASE_RUNE_READER_HPP
