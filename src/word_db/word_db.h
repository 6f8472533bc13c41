#pragma once
#include "core/core.h"
#include "solver/solver.h"
#include <filesystem>
#include <string>
#include <string_view>
#include <vector>

namespace wps::word_db {
  using namespace core;

  class WordDB;


  struct TextStats {
    uint32_t word_count = 0;
    // lines rejected while processing a word list.
    uint32_t dropped_count = 0;
    uint32_t size_bytes = 0;
    uint32_t max_length = 0;
  };


  struct Word {
    uint64_t begin : 28 = 0;
    uint64_t length : 10 = 0;
    uint64_t letters : 26 = 0;

    static constexpr uint32_t kMaxLength = (1u << 10) - 1;
    static constexpr uint32_t kMaxBegin = (1u << 28) - 1;

    Word() = default;

    // s must already be lowercase. returns false if s has a non-letter or does not fit.
    bool read_str(std::string_view s, uint32_t new_begin);

    static bool is_letter(char c) {
      return c >= 'a' && c <= 'z';
    }

    static uint32_t letter_to_idx(char ltr) {
      const auto i = uint32_t(ltr - 'a');
      WPS_VERIFY(i < 26, "");
      return i;
    }

    static uint32_t letter_to_bit(char ltr) {
      return 1u << letter_to_idx(ltr);
    }
  };


  enum class WordIdx : uint32_t {};


  class MatchSet : private std::vector<WordIdx> {
  public:
    using super = std::vector<WordIdx>;

    WPS_DECL_NO_COPY(MatchSet);

    MatchSet() = default;

    void add(WordIdx i) {
      push_back(i);
    }

    using super::size;
    using super::empty;
    using super::begin;
    using super::end;
    using super::front;
    using super::operator[];
  };


  class WordDB {
  public:
    WPS_DECL_NO_COPY(WordDB);

    WordDB() = default;

    explicit WordDB(const std::filesystem::path& path);

    // .txt word list or .pre cache. false and an empty db on failure.
    bool load(const std::filesystem::path& path);

    // one word per line. lines are trimmed and lowercased, anything else non-alpha is dropped.
    bool load_text(std::string_view text);

    // .pre only.
    bool save(const std::filesystem::path& path) const;

    // limit 0 collects every match, otherwise stops after limit matches.
    MatchSet solve(
      std::string_view pattern_text,
      const solver::LengthBounds& bounds,
      uint32_t limit = 0) const;

    std::string hint(std::string_view pattern_text, const solver::LengthBounds& bounds) const;

    uint32_t size() const {
      return uint32_t(words_buf.size());
    }

    bool empty() const {
      return words_buf.empty();
    }

    // true once a load succeeded, even if the list had no words.
    operator bool() const {
      return loaded;
    }

    bool operator !() const {
      return !loaded;
    }

    const TextStats& get_text_stats() const {
      return stats;
    }

    const Word& word(WordIdx i) const {
      WPS_VERIFY(uint32_t(i) < size(), "word index out of range");
      return words_buf[uint32_t(i)];
    }

    std::string_view str(const Word& w) const {
      WPS_VERIFY(size_t(w.begin) + w.length <= text_buf.size(), "word out of range");
      return std::string_view(text_buf.data() + w.begin, w.length);
    }

    std::string_view str(WordIdx i) const {
      return str(word(i));
    }

    std::vector<std::string> to_strings(const MatchSet& matches) const;

    bool is_equivalent(const WordDB& rhs) const;

  private:
    bool load_preproc(const std::filesystem::path& path);

    bool load_word_list(const std::filesystem::path& path);

    void process_word_list(std::string_view text);

    void clear();

  private:
    TextStats stats = {};
    // words packed back to back with no separators.
    std::string text_buf;
    std::vector<Word> words_buf;
    bool loaded = false;
  };
} // namespace wps::word_db
