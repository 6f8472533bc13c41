#include "solver.h"
#include <limits>

namespace wps::solver {
  //
  // pattern text
  //

  std::string normalize_pattern(std::string_view raw) {
    std::string out;
    out.reserve(raw.size());
    for (const char c : raw) {
      if (c >= 'a' && c <= 'z') {
        out += c;
      }
      else if (c >= 'A' && c <= 'Z') {
        out += char(c - 'A' + 'a');
      }
      else if (c == kWildcard) {
        out += c;
      }
    }
    return out;
  }

  std::optional<int32_t> parse_bound(std::string_view text) {
    auto p = text.begin();
    const auto e = text.end();
    for (; p < e && (*p == ' ' || (*p >= '\t' && *p <= '\r')); ++p)
      ;

    bool negative = false;
    if (p < e && (*p == '-' || *p == '+')) {
      negative = (*p == '-');
      ++p;
    }

    constexpr int64_t kLimit = int64_t(std::numeric_limits<int32_t>::max()) + 1;
    int64_t value = 0;
    bool has_digit = false;
    for (; p < e && *p >= '0' && *p <= '9'; ++p) {
      has_digit = true;
      if (value < kLimit) {
        value = value * 10 + (*p - '0');
      }
    }

    if (!has_digit) {
      return std::nullopt;
    }
    if (negative) {
      value = -value;
    }
    if (value > std::numeric_limits<int32_t>::max()) {
      return std::numeric_limits<int32_t>::max();
    }
    if (value < std::numeric_limits<int32_t>::min()) {
      return std::numeric_limits<int32_t>::min();
    }
    return int32_t(value);
  }


  //
  // LetterCounts
  //

  LetterCounts LetterCounts::from_pattern(std::string_view pattern) {
    LetterCounts lc;
    for (const char c : pattern) {
      if (c == kWildcard) {
        ++lc.wildcards;
        continue;
      }
      const auto i = uint32_t(c - 'a');
      if (i < 26) {
        ++lc.counts[i];
        lc.letters |= 1u << i;
      }
    }
    return lc;
  }


  //
  // LengthBounds
  //

  LengthBounds LengthBounds::from_text(std::string_view min_text, std::string_view max_text) {
    LengthBounds bounds;
    bounds.min_length = parse_bound(min_text).value_or(1);
    bounds.max_length = parse_bound(max_text);
    return bounds;
  }


  //
  // matching
  //

  bool can_form(std::string_view word, const LetterCounts& counts) {
    if (word.size() > counts.budget()) {
      return false;
    }

    uint32_t remaining[26];
    memcpy(remaining, counts.counts, sizeof(remaining));
    uint32_t wildcards = counts.wildcards;

    for (const char c : word) {
      const auto i = uint32_t(c - 'a');
      if (i < 26 && remaining[i]) {
        --remaining[i];
      }
      else if (wildcards) {
        --wildcards;
      }
      else {
        return false;
      }
    }
    return true;
  }

  std::vector<std::string> solve(
    std::string_view pattern_text,
    const std::vector<std::string>& dictionary,
    const LengthBounds& bounds)
  {
    std::vector<std::string> matches;
    if (pattern_text.empty()) {
      return matches;
    }

    const auto counts = LetterCounts::from_pattern(normalize_pattern(pattern_text));
    for (const auto& word : dictionary) {
      if (bounds.contains(word.size()) && can_form(word, counts)) {
        matches.push_back(word);
      }
    }
    return matches;
  }

  std::string hint(
    std::string_view pattern_text,
    const std::vector<std::string>& dictionary,
    const LengthBounds& bounds)
  {
    const auto matches = solve(pattern_text, dictionary, bounds);
    return matches.empty() ? std::string(kNoHint) : format_hint(matches.front());
  }

  std::string format_hint(std::string_view first_match) {
    std::string out(first_match.substr(0, kHintPrefixLength));
    out += kHintSuffix;
    return out;
  }
} // namespace wps::solver
