#ifndef BASE_RUNE_READER_HPP
#define BASE_RUNE_READER_HPP

#include "utils/utils.hpp"

#include <optional>

class IRuneReader {
public:
  virtual ~IRuneReader() = default;

  // Fetches the next decoded code point together with its encoded width.
  // Returns nullopt at the end of the input and after a read error; use
  // has_error() to tell the two apart
  virtual std::optional<Utils::DecodedRune> read_rune() = 0;

  virtual bool has_error() const { return false; }

  // Called from another thread to make a pending or future read_rune()
  // return nullopt. Readers over in-memory data have nothing to wake
  virtual void interrupt() {}
};

#endif // BASE_RUNE_READER_HPP
