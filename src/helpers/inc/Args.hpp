#ifndef TIMECACHE_HELPERS_ARGS_HPP
#define TIMECACHE_HELPERS_ARGS_HPP
/**
 * @file Args.hpp
 * @brief Command-line flag parsing for the timecache tools.
 *
 * Fixed-arity flags plus strict numeric value parsing. Cold-path only.
 *
 * @note Cold-path: Allocates std::unordered_map for parsed results.
 */

#include <algorithm>
#include <bitset>
#include <charconv>
#include <cstdint>
#include <functional>
#include <optional>
#include <span>
#include <string>
#include <string_view>
#include <system_error>
#include <unordered_map>
#include <utility>
#include <vector>

#include <fmt/core.h>

namespace timecache {
namespace helpers {
namespace args {

/* ----------------------------- Types ----------------------------- */

/**
 * @brief Definition for a CLI argument flag.
 */
struct ArgDef {
  std::string_view flag;   ///< Flag string, e.g. "--interval"
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
 * When a flag is matched it consumes the next nargs tokens literally as its
 * values. Tokens that match no flag are rejected.
 *
 * @param args   Argument list (non-owning views; must outlive the call).
 * @param map    Definitions of accepted flags and their requirements.
 * @param pargs  Output map of parsed values (entries are overwritten per key).
 * @param error  Optional error message target (set on failure when provided).
 * @return true on success; false on error (and sets error if provided).
 * @note Cold-path: Allocates internally.
 */
[[nodiscard]] inline bool
parseArgs(std::span<const std::string_view> args, const ArgMap& map, ParsedArgs& pargs,
          std::optional<std::reference_wrapper<std::string>> error = std::nullopt) noexcept {
  auto fail = [&error](std::string msg) {
    if (error) {
      error->get() = std::move(msg);
    }
    return false;
  };

  // Reverse lookup: flag -> key
  std::unordered_map<std::string_view, std::uint8_t> lut;
  lut.reserve(map.size());
  for (const auto& KV : map) {
    lut.emplace(KV.second.flag, KV.first);
  }

  std::bitset<256> seen;
  const std::size_t N = args.size();

  for (std::size_t i = 0; i < N; ++i) {
    const std::string_view TOK = args[i];
    const auto IT = lut.find(TOK);
    if (IT == lut.end()) {
      return fail(fmt::format("Unknown argument '{}'", TOK));
    }

    const std::uint8_t KEY = IT->second;
    const ArgDef& DEF = map.at(KEY);

    if (i + static_cast<std::size_t>(DEF.nargs) >= N) {
      return fail(fmt::format("Argument out of bounds: expected {} values for flag '{}'",
                              static_cast<unsigned>(DEF.nargs), DEF.flag));
    }

    auto& out = pargs[KEY];
    out.assign(args.begin() + static_cast<std::ptrdiff_t>(i + 1),
               args.begin() + static_cast<std::ptrdiff_t>(i + 1 + DEF.nargs));

    seen.set(KEY);
    i += DEF.nargs;
  }

  for (const auto& KV : map) {
    if (KV.second.required && !seen.test(KV.first)) {
      return fail(fmt::format("Missing required argument '{}'", KV.second.flag));
    }
  }

  return true;
}

/// @brief True if the flag for key was given.
[[nodiscard]] inline bool hasFlag(const ParsedArgs& pargs, std::uint8_t key) noexcept {
  return pargs.find(key) != pargs.end();
}

/**
 * @brief Parse a whole token as an unsigned decimal integer.
 * @return Value, or std::nullopt on empty input, trailing characters, a sign
 *         or overflow.
 */
[[nodiscard]] inline std::optional<std::uint64_t> parseUnsigned(std::string_view token) noexcept {
  std::uint64_t value = 0;
  const char* const END = token.data() + token.size();
  const auto [ptr, ec] = std::from_chars(token.data(), END, value);
  if (token.empty() || ec != std::errc{} || ptr != END) {
    return std::nullopt;
  }
  return value;
}

/**
 * @brief Read the first value of key as an unsigned integer within [lo, hi].
 * @param pargs  Parsed arguments.
 * @param key    Flag key; must have nargs >= 1.
 * @param lo     Smallest accepted value.
 * @param hi     Largest accepted value.
 * @param error  Message target on failure.
 * @return Value, or std::nullopt if the flag is absent (error untouched) or
 *         invalid (error set).
 */
[[nodiscard]] inline std::optional<std::uint64_t>
unsignedValue(const ParsedArgs& pargs, std::uint8_t key, std::uint64_t lo, std::uint64_t hi,
              std::string& error) {
  const auto IT = pargs.find(key);
  if (IT == pargs.end() || IT->second.empty()) {
    return std::nullopt;
  }

  const std::string_view TOK = IT->second.front();
  const std::optional<std::uint64_t> V = parseUnsigned(TOK);
  if (!V || *V < lo || *V > hi) {
    error = fmt::format("Invalid value '{}': expected an integer in [{}, {}]", TOK, lo, hi);
    return std::nullopt;
  }
  return V;
}

/**
 * @brief Print usage information for a CLI tool.
 *
 * @param progName    Program name (typically argv[0]).
 * @param description Brief description of the tool's purpose.
 * @param map         Argument definitions to document.
 * @note Cold-path: Performs I/O.
 */
inline void printUsage(const char* progName, std::string_view description,
                       const ArgMap& map) noexcept {
  fmt::print("Usage: {} [OPTIONS]\n\n", progName);

  if (!description.empty()) {
    fmt::print("{}\n\n", description);
  }

  fmt::print("Options:\n");

  // Sorted by flag for stable output
  std::vector<const ArgDef*> entries;
  entries.reserve(map.size());
  for (const auto& KV : map) {
    entries.push_back(&KV.second);
  }
  std::sort(entries.begin(), entries.end(),
            [](const ArgDef* a, const ArgDef* b) { return a->flag < b->flag; });

  std::vector<std::string> flagCols;
  flagCols.reserve(entries.size());
  std::size_t width = 16;
  for (const ArgDef* def : entries) {
    std::string col(def->flag);
    for (std::uint8_t k = 0; k < def->nargs; ++k) {
      col.append(" <value>");
    }
    width = std::max(width, col.size());
    flagCols.push_back(std::move(col));
  }
  width = std::min<std::size_t>(width, 30);

  for (std::size_t i = 0; i < entries.size(); ++i) {
    const ArgDef& DEF = *entries[i];
    fmt::print("  {:<{}}  {}", flagCols[i], width, DEF.desc);
    if (DEF.required) {
      fmt::print("{}(required)", DEF.desc.empty() ? "" : " ");
    }
    fmt::print("\n");
  }
}

} // namespace args
} // namespace helpers
} // namespace timecache

#endif // TIMECACHE_HELPERS_ARGS_HPP
