#ifndef WARDEN_HELPERS_STRINGS_HPP
#define WARDEN_HELPERS_STRINGS_HPP
/**
 * @file Strings.hpp
 * @brief String parsing helpers for command output and procfs text.
 *
 * All functions operate on std::string_view and never allocate except
 * splitFields(), which returns a vector of views into the caller's buffer.
 *
 * @note Views returned by these helpers alias the input; the input must outlive them.
 */

#include <charconv> // std::from_chars
#include <cstddef>
#include <cstdint>
#include <string_view>
#include <system_error> // std::errc
#include <vector>

namespace warden {
namespace helpers {
namespace strings {

/* ----------------------------- Trimming ----------------------------- */

/**
 * @brief Test for ASCII whitespace (space, tab, CR, LF).
 * @param c Character to test.
 * @return true for whitespace.
 */
[[nodiscard]] constexpr bool isSpace(char c) noexcept {
  return c == ' ' || c == '\t' || c == '\r' || c == '\n';
}

/**
 * @brief Strip leading and trailing whitespace.
 * @param sv Input view.
 * @return Trimmed view into the same buffer.
 */
[[nodiscard]] inline std::string_view trim(std::string_view sv) noexcept {
  while (!sv.empty() && isSpace(sv.front())) {
    sv.remove_prefix(1);
  }
  while (!sv.empty() && isSpace(sv.back())) {
    sv.remove_suffix(1);
  }
  return sv;
}

/* ----------------------------- Splitting ----------------------------- */

/**
 * @brief Split on a delimiter, keeping empty fields.
 * @param sv Input view.
 * @param delim Field separator.
 * @return Fields in order; a single empty field for empty input.
 */
[[nodiscard]] inline std::vector<std::string_view> splitFields(std::string_view sv, char delim) {
  std::vector<std::string_view> out;
  std::size_t start = 0;
  while (true) {
    const std::size_t POS = sv.find(delim, start);
    if (POS == std::string_view::npos) {
      out.push_back(sv.substr(start));
      break;
    }
    out.push_back(sv.substr(start, POS - start));
    start = POS + 1;
  }
  return out;
}

/**
 * @brief Pop the next line (without its terminator) from a text buffer.
 * @param text Remaining text; advanced past the returned line.
 * @param line Output line.
 * @return false when text is exhausted.
 */
[[nodiscard]] inline bool nextLine(std::string_view& text, std::string_view& line) noexcept {
  if (text.empty()) {
    return false;
  }
  const std::size_t POS = text.find('\n');
  if (POS == std::string_view::npos) {
    line = text;
    text = {};
  } else {
    line = text.substr(0, POS);
    text.remove_prefix(POS + 1);
  }
  if (!line.empty() && line.back() == '\r') {
    line.remove_suffix(1);
  }
  return true;
}

/* ----------------------------- Numbers ----------------------------- */

/**
 * @brief Parse a complete signed decimal integer.
 * @param sv Input (surrounding whitespace is ignored).
 * @param out Parsed value; untouched on failure.
 * @return true only if the whole trimmed input is a valid integer.
 */
[[nodiscard]] inline bool parseInt64(std::string_view sv, std::int64_t& out) noexcept {
  sv = trim(sv);
  if (sv.empty()) {
    return false;
  }
  std::int64_t value = 0;
  const char* const END = sv.data() + sv.size();
  const auto RES = std::from_chars(sv.data(), END, value, 10);
  if (RES.ec != std::errc{} || RES.ptr != END) {
    return false;
  }
  out = value;
  return true;
}

/**
 * @brief Parse a complete decimal integer that fits a positive PID.
 * @param sv Input (surrounding whitespace is ignored).
 * @param out Parsed PID; untouched on failure.
 * @return true for values in [1, INT32_MAX].
 */
[[nodiscard]] inline bool parsePid(std::string_view sv, std::int32_t& out) noexcept {
  std::int64_t value = 0;
  if (!parseInt64(sv, value) || value <= 0 || value > INT32_MAX) {
    return false;
  }
  out = static_cast<std::int32_t>(value);
  return true;
}

/* ----------------------------- Matching ----------------------------- */

/**
 * @brief Check if string starts with prefix.
 * @param str String to check.
 * @param prefix Prefix to look for.
 * @return true if str starts with prefix.
 */
[[nodiscard]] inline bool startsWith(std::string_view str, std::string_view prefix) noexcept {
  return str.size() >= prefix.size() && str.compare(0, prefix.size(), prefix) == 0;
}

/**
 * @brief Check if every character is an ASCII digit (false for empty input).
 */
[[nodiscard]] inline bool isAllDigits(std::string_view sv) noexcept {
  if (sv.empty()) {
    return false;
  }
  for (const char C : sv) {
    if (C < '0' || C > '9') {
      return false;
    }
  }
  return true;
}

} // namespace strings
} // namespace helpers
} // namespace warden

#endif // WARDEN_HELPERS_STRINGS_HPP
