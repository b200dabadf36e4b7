#ifndef WARDEN_HELPERS_ARGS_HPP
#define WARDEN_HELPERS_ARGS_HPP
/**
 * @file Args.hpp
 * @brief CLI argument parsing utilities.
 *
 * Fixed-arity flag parser for the warden tools. Cold-path only.
 *
 * @note Allocates std::unordered_map for parsed results.
 */

#include <algorithm>
#include <bitset>
#include <cstdint>
#include <optional>
#include <span>
#include <string>
#include <string_view>
#include <unordered_map>
#include <utility>
#include <vector>

#include <fmt/core.h>

namespace warden {
namespace helpers {
namespace args {

/* ----------------------------- Types ----------------------------- */

/**
 * @brief Definition for a CLI argument flag.
 */
struct ArgDef {
  std::string_view flag;   ///< Flag string, e.g. "--foo"
  std::uint8_t nargs;      ///< Number of values required after the flag
  bool required;           ///< True if flag must be provided
  std::string_view desc{}; ///< Description for help output (optional)
};

/// Map from key to argument definition.
using ArgMap = std::unordered_map<std::uint8_t, ArgDef>;

/// Map from key to parsed values.
using ParsedArgs = std::unordered_map<std::uint8_t, std::vector<std::string_view>>;

/* ----------------------------- API ----------------------------- */

/**
 * @brief Parse user-provided arguments according to a flag map.
 *
 * When a flag is matched, the next nargs tokens are consumed literally as its
 * values. Tokens that match no flag are rejected.
 *
 * @param args   Argument list (non-owning views; must outlive pargs).
 * @param map    Definitions of accepted flags and their requirements.
 * @param pargs  Output map of parsed values (entries are overwritten per key).
 * @param error  Set to a one-line message on failure.
 * @return true on success.
 */
[[nodiscard]] inline bool parseArgs(std::span<const std::string_view> args, const ArgMap& map,
                                    ParsedArgs& pargs, std::string& error) {
  std::unordered_map<std::string_view, std::pair<std::uint8_t, const ArgDef*>> lut;
  lut.reserve(map.size());
  for (const auto& KV : map) {
    lut.emplace(KV.second.flag, std::make_pair(KV.first, &KV.second));
  }

  std::bitset<256> seen;
  const std::size_t N = args.size();

  for (std::size_t i = 0; i < N; ++i) {
    const std::string_view TOK = args[i];
    const auto IT = lut.find(TOK);
    if (IT == lut.end()) {
      error = fmt::format("Unknown argument '{}'", TOK);
      return false;
    }

    const std::uint8_t KEY = IT->second.first;
    const ArgDef& DEF = *IT->second.second;

    if (i + static_cast<std::size_t>(DEF.nargs) >= N) {
      error = fmt::format("Argument out of bounds: expected {} values for flag '{}'", DEF.nargs,
                          DEF.flag);
      return false;
    }

    auto& out = pargs[KEY];
    out.clear();
    out.reserve(DEF.nargs);
    for (std::uint8_t k = 0; k < DEF.nargs; ++k) {
      out.emplace_back(args[i + 1 + k]);
    }

    seen.set(KEY);
    i += DEF.nargs;
  }

  for (const auto& KV : map) {
    if (KV.second.required && !seen.test(KV.first)) {
      error = fmt::format("Missing required argument '{}'", KV.second.flag);
      return false;
    }
  }

  return true;
}

/**
 * @brief Check whether a flag was given.
 */
[[nodiscard]] inline bool hasFlag(const ParsedArgs& pargs, std::uint8_t key) noexcept {
  return pargs.find(key) != pargs.end();
}

/**
 * @brief First value of a flag, if given with at least one value.
 */
[[nodiscard]] inline std::optional<std::string_view> firstValue(const ParsedArgs& pargs,
                                                                std::uint8_t key) noexcept {
  const auto IT = pargs.find(key);
  if (IT == pargs.end() || IT->second.empty()) {
    return std::nullopt;
  }
  return IT->second.front();
}

/**
 * @brief Print usage information for a CLI tool.
 *
 * @param progName    Program name (typically argv[0]).
 * @param description Brief description of the tool's purpose.
 * @param map         Argument definitions to document.
 */
inline void printUsage(const char* progName, std::string_view description, const ArgMap& map) {
  fmt::print("Usage: {} [OPTIONS]\n\n", progName);

  if (!description.empty()) {
    fmt::print("{}\n\n", description);
  }

  fmt::print("Options:\n");

  std::vector<const ArgDef*> entries;
  entries.reserve(map.size());
  for (const auto& KV : map) {
    entries.push_back(&KV.second);
  }
  std::sort(entries.begin(), entries.end(),
            [](const ArgDef* a, const ArgDef* b) { return a->flag < b->flag; });

  std::size_t width = 16;
  for (const ArgDef* DEF : entries) {
    const std::size_t W = DEF->flag.size() + (DEF->nargs > 0 ? 8 : 0);
    width = std::max(width, W);
  }
  width = std::min<std::size_t>(width, 30);

  for (const ArgDef* DEF : entries) {
    std::string flagStr(DEF->flag);
    if (DEF->nargs > 0) {
      flagStr.append(" <value>");
    }
    fmt::print("  {:<{}}  {}{}\n", flagStr, width, DEF->desc, DEF->required ? " (required)" : "");
  }
}

} // namespace args
} // namespace helpers
} // namespace warden

#endif // WARDEN_HELPERS_ARGS_HPP
