#pragma once
#include "core/core.h"
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace wps::solver {
  using namespace core;

  constexpr char kWildcard = '*';
  constexpr size_t kHintPrefixLength = 2;
  constexpr const char* kHintSuffix = "...";
  constexpr const char* kNoHint = "No hints available";


  // keeps ascii letters and wildcards, lowercased. "C-*t!" -> "c*t"
  std::string normalize_pattern(std::string_view raw);

  // leading whitespace, optional sign, digits. junk after the digits is ignored,
  // no digits at all means no bound. saturates at the int32 range.
  std::optional<int32_t> parse_bound(std::string_view text);


  struct LetterCounts {
    uint32_t counts[26] = {};
    uint32_t wildcards = 0;
    // bit i set when counts[i] > 0
    uint32_t letters = 0;

    static LetterCounts from_pattern(std::string_view pattern);

    uint32_t letter_total() const {
      uint32_t total = 0;
      for (auto c : counts) {
        total += c;
      }
      return total;
    }

    // longest word that could possibly be covered.
    uint32_t budget() const {
      return letter_total() + wildcards;
    }

    bool empty() const {
      return !wildcards && !letters;
    }
  };


  struct LengthBounds {
    std::optional<int32_t> min_length;
    std::optional<int32_t> max_length;

    static LengthBounds unbounded() {
      return LengthBounds{};
    }

    static LengthBounds between(int32_t min_len, int32_t max_len) {
      return LengthBounds{ min_len, max_len };
    }

    // malformed or empty text leaves the bound absent: min 1, max unbounded.
    static LengthBounds from_text(std::string_view min_text, std::string_view max_text);

    // min > max is allowed and contains nothing.
    bool contains(size_t length) const {
      const auto len = int64_t(length);
      if (min_length && len < int64_t(*min_length)) {
        return false;
      }
      if (max_length && len > int64_t(*max_length)) {
        return false;
      }
      return true;
    }
  };


  // true when every letter of word can be drawn from counts, each pattern letter
  // or wildcard used at most once. not every pattern letter has to be used.
  bool can_form(std::string_view word, const LetterCounts& counts);

  // dictionary entries passing the length filter and can_form, in dictionary order.
  std::vector<std::string> solve(
    std::string_view pattern_text,
    const std::vector<std::string>& dictionary,
    const LengthBounds& bounds);

  // first two letters of the first match plus "...", or kNoHint.
  std::string hint(
    std::string_view pattern_text,
    const std::vector<std::string>& dictionary,
    const LengthBounds& bounds);

  // hint text for a first match. words shorter than the prefix are shown whole.
  std::string format_hint(std::string_view first_match);
} // namespace wps::solver
