#ifndef UTILS_HPP
#define UTILS_HPP

#include <algorithm>
#include <cctype>
#include <charconv>
#include <cstddef>
#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <system_error>
#include <type_traits>
#include <vector>

namespace Utils {

// Substituted for every byte that does not start a valid UTF-8 sequence
constexpr char32_t RUNE_ERROR = 0xFFFD;
constexpr char32_t MAX_RUNE = 0x10FFFF;
constexpr size_t UTF8_MAX_WIDTH = 4;

// A decoded code point and the number of bytes it occupied in the input
struct DecodedRune {
  char32_t rune = RUNE_ERROR;
  size_t width = 0;
};

std::vector<std::string> split_string(const std::string &text, char delimiter);
std::vector<std::string> split_whitespace(std::string_view text);

// Decodes the first code point of `bytes`. Invalid, overlong, surrogate and
// truncated sequences decode to RUNE_ERROR with width 1. Empty input yields
// width 0.
DecodedRune decode_utf8(std::string_view bytes);
std::vector<char32_t> decode_utf8_string(std::string_view text);
std::string encode_utf8(char32_t rune);

char32_t to_lower_rune(char32_t rune);
std::string to_lower_utf8(std::string_view text);

template <typename T> std::optional<T> string_to_number(std::string_view s) {
  if (s.empty() || s == "-") {
    if constexpr (std::is_floating_point_v<T>)
      return static_cast<T>(0.0);
    if constexpr (std::is_integral_v<T>)
      return static_cast<T>(0);
    return std::nullopt;
  }

  T value;
  auto [ptr, ec] = std::from_chars(s.data(), s.data() + s.size(), value);

  if (ec == std::errc() && ptr == s.data() + s.size())
    return value;
  return std::nullopt;
}

inline void ltrim_inplace(std::string &s) {
  s.erase(s.begin(), std::find_if(s.begin(), s.end(), [](unsigned char ch) {
            return !std::isspace(ch);
          }));
}

inline void rtrim_inplace(std::string &s) {
  s.erase(std::find_if(s.rbegin(), s.rend(),
                       [](unsigned char ch) { return !std::isspace(ch); })
              .base(),
          s.end());
}

inline void trim_inplace(std::string &s) {
  ltrim_inplace(s);
  rtrim_inplace(s);
}

inline std::string trim_copy(std::string_view sv) {
  std::string s{sv};
  trim_inplace(s);
  return s;
}
} // namespace Utils

#endif // UTILS_HPP
