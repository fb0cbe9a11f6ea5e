/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include <cctype>
#include <charconv>
#include <cstdint>
#include <limits>
#include <optional>
#include <span>
#include <string_view>

namespace tally::util {

  /**
   * Case-insensitive comparison of two ASCII string views.
   */
  inline bool iequals(std::string_view lhs, std::string_view rhs) {
    if (lhs.size() != rhs.size()) {
      return false;
    }
    for (size_t i = 0; i < lhs.size(); ++i) {
      if (std::tolower(static_cast<unsigned char>(lhs[i]))
          != std::tolower(static_cast<unsigned char>(rhs[i]))) {
        return false;
      }
    }
    return true;
  }

  namespace detail {

    struct Unit {
      std::string_view suffix;
      uint64_t multiplier;
    };

    /**
     * Parses `<digits>[ ]<suffix>` and scales the number by the multiplier of
     * the matching suffix. Bare numbers are taken with multiplier 1.
     */
    inline std::optional<uint64_t> parseQuantity(std::string_view input,
                                                 std::span<const Unit> units) {
      constexpr std::string_view kSpaces = " \t\n\r";
      auto first = input.find_first_not_of(kSpaces);
      if (first == std::string_view::npos) {
        return std::nullopt;
      }
      auto last = input.find_last_not_of(kSpaces);
      input = input.substr(first, last - first + 1);

      uint64_t number = 0;
      auto [ptr, ec] =
          std::from_chars(input.data(), input.data() + input.size(), number);
      if (ec != std::errc() or ptr == input.data()) {
        return std::nullopt;
      }

      auto suffix = input.substr(ptr - input.data());
      while (not suffix.empty()
             and std::isspace(static_cast<unsigned char>(suffix.front()))) {
        suffix.remove_prefix(1);
      }
      if (suffix.empty()) {
        return number;
      }

      for (const auto &[unit_suffix, multiplier] : units) {
        if (iequals(unit_suffix, suffix)) {
          if (number > std::numeric_limits<uint64_t>::max() / multiplier) {
            return std::nullopt;
          }
          return number * multiplier;
        }
      }
      return std::nullopt;
    }

  }  // namespace detail

  /**
   * Parses a byte size such as "4096", "512Mb" or "1 GiB" into bytes.
   * Single-letter suffixes (K, M, G, T) are 1024-based.
   */
  inline std::optional<uint64_t> parseByteQuantity(std::string_view input) {
    static constexpr detail::Unit kUnits[] = {
        {"b", 1},
        {"k", 1ull << 10},
        {"kib", 1ull << 10},
        {"kb", 1000ull},
        {"m", 1ull << 20},
        {"mib", 1ull << 20},
        {"mb", 1000ull * 1000},
        {"g", 1ull << 30},
        {"gib", 1ull << 30},
        {"gb", 1000ull * 1000 * 1000},
        {"t", 1ull << 40},
        {"tib", 1ull << 40},
        {"tb", 1000ull * 1000 * 1000 * 1000},
    };
    return detail::parseQuantity(input, kUnits);
  }

  /**
   * Parses a duration such as "3600", "60m" or "1 hour" into seconds.
   */
  inline std::optional<uint64_t> parseTimeDuration(std::string_view input) {
    static constexpr detail::Unit kUnits[] = {
        {"s", 1},           {"sec", 1},       {"secs", 1},
        {"second", 1},      {"seconds", 1},   {"m", 60},
        {"min", 60},        {"mins", 60},     {"minute", 60},
        {"minutes", 60},    {"h", 3600},      {"hr", 3600},
        {"hrs", 3600},      {"hour", 3600},   {"hours", 3600},
        {"d", 86400},       {"day", 86400},   {"days", 86400},
    };
    return detail::parseQuantity(input, kUnits);
  }

}  // namespace tally::util
