#ifndef WARDEN_HELPERS_FORMAT_HPP
#define WARDEN_HELPERS_FORMAT_HPP
/**
 * @file Format.hpp
 * @brief Human-readable and JSON formatting utilities.
 *
 * Provides consistent formatting across tools, audit records and logs.
 * Uses fmt library for string formatting.
 *
 * @note All functions return or append to std::string (heap allocation).
 */

#include <cstdint>
#include <string>
#include <string_view>

#include <fmt/core.h>
#include <fmt/format.h>

namespace warden {
namespace helpers {
namespace format {

/* ----------------------------- API ----------------------------- */

/**
 * @brief Format bytes using binary units (KiB, MiB, GiB, TiB).
 * @param bytes Byte count.
 * @return Formatted string (e.g., "1.5 GiB").
 */
[[nodiscard]] inline std::string bytesBinary(std::uint64_t bytes) {
  if (bytes == 0) {
    return "0 B";
  }

  static constexpr std::uint64_t KIB = 1024ULL;
  static constexpr std::uint64_t MIB = KIB * 1024ULL;
  static constexpr std::uint64_t GIB = MIB * 1024ULL;
  static constexpr std::uint64_t TIB = GIB * 1024ULL;

  if (bytes >= TIB) {
    return fmt::format("{:.1f} TiB", static_cast<double>(bytes) / static_cast<double>(TIB));
  }
  if (bytes >= GIB) {
    return fmt::format("{:.1f} GiB", static_cast<double>(bytes) / static_cast<double>(GIB));
  }
  if (bytes >= MIB) {
    return fmt::format("{:.1f} MiB", static_cast<double>(bytes) / static_cast<double>(MIB));
  }
  if (bytes >= KIB) {
    return fmt::format("{:.1f} KiB", static_cast<double>(bytes) / static_cast<double>(KIB));
  }

  return fmt::format("{} B", bytes);
}

/**
 * @brief Length of the well-formed UTF-8 sequence starting at sv[i].
 * @param sv Text.
 * @param i Index of a byte >= 0x80.
 * @return 2..4, or 0 if the bytes are not a valid sequence (overlong forms,
 *         surrogates and code points above U+10FFFF are invalid).
 */
[[nodiscard]] inline std::size_t utf8SequenceLength(std::string_view sv, std::size_t i) noexcept {
  const auto BYTE = [&sv](std::size_t k) { return static_cast<unsigned char>(sv[k]); };
  const unsigned char LEAD = BYTE(i);
  std::size_t len = 0;
  unsigned char lo = 0x80;
  unsigned char hi = 0xBF;
  if (LEAD >= 0xC2 && LEAD <= 0xDF) {
    len = 2;
  } else if (LEAD >= 0xE0 && LEAD <= 0xEF) {
    len = 3;
    lo = (LEAD == 0xE0) ? 0xA0 : 0x80;
    hi = (LEAD == 0xED) ? 0x9F : 0xBF;
  } else if (LEAD >= 0xF0 && LEAD <= 0xF4) {
    len = 4;
    lo = (LEAD == 0xF0) ? 0x90 : 0x80;
    hi = (LEAD == 0xF4) ? 0x8F : 0xBF;
  } else {
    return 0;
  }
  if (i + len > sv.size()) {
    return 0;
  }
  if (BYTE(i + 1) < lo || BYTE(i + 1) > hi) {
    return 0;
  }
  for (std::size_t k = 2; k < len; ++k) {
    if (BYTE(i + k) < 0x80 || BYTE(i + k) > 0xBF) {
      return 0;
    }
  }
  return len;
}

/**
 * @brief Append a JSON string literal (with quotes) to out.
 * @param out Destination.
 * @param sv Raw text; control characters and NULs are escaped, and bytes that
 *           are not well-formed UTF-8 become U+FFFD, one per byte.
 */
inline void appendJsonString(std::string& out, std::string_view sv) {
  out.push_back('"');
  std::size_t i = 0;
  while (i < sv.size()) {
    const char C = sv[i];
    if (static_cast<unsigned char>(C) >= 0x80) {
      const std::size_t LEN = utf8SequenceLength(sv, i);
      if (LEN == 0) {
        out += "\\ufffd";
        ++i;
      } else {
        out.append(sv.substr(i, LEN));
        i += LEN;
      }
      continue;
    }
    switch (C) {
    case '"':
      out += "\\\"";
      break;
    case '\\':
      out += "\\\\";
      break;
    case '\n':
      out += "\\n";
      break;
    case '\r':
      out += "\\r";
      break;
    case '\t':
      out += "\\t";
      break;
    default:
      if (static_cast<unsigned char>(C) < 0x20) {
        out += fmt::format("\\u{:04x}", static_cast<unsigned int>(static_cast<unsigned char>(C)));
      } else {
        out.push_back(C);
      }
      break;
    }
    ++i;
  }
  out.push_back('"');
}

/**
 * @brief Quote text as a JSON string literal.
 * @param sv Raw text.
 * @return Quoted, escaped literal.
 */
[[nodiscard]] inline std::string jsonString(std::string_view sv) {
  std::string out;
  out.reserve(sv.size() + 2);
  appendJsonString(out, sv);
  return out;
}

} // namespace format
} // namespace helpers
} // namespace warden

#endif // WARDEN_HELPERS_FORMAT_HPP
