#include "utils.hpp"

#include <cstddef>
#include <cstdint>
#include <cwctype>
#include <sstream>
#include <string>
#include <string_view>
#include <vector>

namespace Utils {

std::vector<std::string> split_string(const std::string &text, char delimiter) {
  std::vector<std::string> tokens;
  std::string current_token;
  std::istringstream token_stream(text);

  while (std::getline(token_stream, current_token, delimiter)) {
    tokens.push_back(current_token);
  }
  return tokens;
}

std::vector<std::string> split_whitespace(std::string_view text) {
  std::vector<std::string> words;
  size_t i = 0;
  while (i < text.size()) {
    while (i < text.size() &&
           std::isspace(static_cast<unsigned char>(text[i])))
      i++;
    size_t start = i;
    while (i < text.size() &&
           !std::isspace(static_cast<unsigned char>(text[i])))
      i++;
    if (i > start)
      words.emplace_back(text.substr(start, i - start));
  }
  return words;
}

DecodedRune decode_utf8(std::string_view bytes) {
  if (bytes.empty())
    return {RUNE_ERROR, 0};

  const auto b0 = static_cast<unsigned char>(bytes[0]);
  if (b0 < 0x80)
    return {static_cast<char32_t>(b0), 1};

  size_t width;
  char32_t rune;
  char32_t min_rune;
  if ((b0 & 0xE0) == 0xC0) {
    width = 2;
    rune = b0 & 0x1F;
    min_rune = 0x80;
  } else if ((b0 & 0xF0) == 0xE0) {
    width = 3;
    rune = b0 & 0x0F;
    min_rune = 0x800;
  } else if ((b0 & 0xF8) == 0xF0) {
    width = 4;
    rune = b0 & 0x07;
    min_rune = 0x10000;
  } else {
    return {RUNE_ERROR, 1};
  }

  if (bytes.size() < width)
    return {RUNE_ERROR, 1};

  for (size_t i = 1; i < width; ++i) {
    const auto b = static_cast<unsigned char>(bytes[i]);
    if ((b & 0xC0) != 0x80)
      return {RUNE_ERROR, 1};
    rune = (rune << 6) | (b & 0x3F);
  }

  // Overlong forms, UTF-16 surrogates and out-of-range values
  if (rune < min_rune || rune > MAX_RUNE || (rune >= 0xD800 && rune <= 0xDFFF))
    return {RUNE_ERROR, 1};

  return {rune, width};
}

std::vector<char32_t> decode_utf8_string(std::string_view text) {
  std::vector<char32_t> runes;
  runes.reserve(text.size());
  while (!text.empty()) {
    DecodedRune decoded = decode_utf8(text);
    runes.push_back(decoded.rune);
    text.remove_prefix(decoded.width);
  }
  return runes;
}

std::string encode_utf8(char32_t rune) {
  if (rune > MAX_RUNE || (rune >= 0xD800 && rune <= 0xDFFF))
    rune = RUNE_ERROR;

  std::string out;
  if (rune < 0x80) {
    out += static_cast<char>(rune);
  } else if (rune < 0x800) {
    out += static_cast<char>(0xC0 | (rune >> 6));
    out += static_cast<char>(0x80 | (rune & 0x3F));
  } else if (rune < 0x10000) {
    out += static_cast<char>(0xE0 | (rune >> 12));
    out += static_cast<char>(0x80 | ((rune >> 6) & 0x3F));
    out += static_cast<char>(0x80 | (rune & 0x3F));
  } else {
    out += static_cast<char>(0xF0 | (rune >> 18));
    out += static_cast<char>(0x80 | ((rune >> 12) & 0x3F));
    out += static_cast<char>(0x80 | ((rune >> 6) & 0x3F));
    out += static_cast<char>(0x80 | (rune & 0x3F));
  }
  return out;
}

// ASCII is folded directly; everything else goes through the C library and
// therefore follows the process LC_CTYPE locale.
char32_t to_lower_rune(char32_t rune) {
  if (rune < 0x80)
    return static_cast<char32_t>(std::tolower(static_cast<int>(rune)));
  return static_cast<char32_t>(std::towlower(static_cast<wint_t>(rune)));
}

std::string to_lower_utf8(std::string_view text) {
  std::string lowered;
  lowered.reserve(text.size());
  while (!text.empty()) {
    DecodedRune decoded = decode_utf8(text);
    if (decoded.rune == RUNE_ERROR && decoded.width == 1)
      lowered += text[0]; // keep invalid bytes as they were
    else
      lowered += encode_utf8(to_lower_rune(decoded.rune));
    text.remove_prefix(decoded.width);
  }
  return lowered;
}

} // namespace Utils
