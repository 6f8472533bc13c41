#include "word_db.h"
#include <algorithm>

namespace wps::word_db {
  namespace {
    constexpr uint32_t kPreMagic = 0x31535057; // "WPS1"
    constexpr uint32_t kPreVersion = 1;

    struct PreHeader {
      uint32_t magic = kPreMagic;
      uint32_t version = kPreVersion;
      TextStats stats = {};
    };

    bool is_space(char c) {
      return c == ' ' || (c >= '\t' && c <= '\r');
    }

    std::string_view trim(std::string_view s) {
      while (!s.empty() && is_space(s.front())) {
        s.remove_prefix(1);
      }
      while (!s.empty() && is_space(s.back())) {
        s.remove_suffix(1);
      }
      return s;
    }
  }


  //
  // Word
  //

  bool Word::read_str(std::string_view s, uint32_t new_begin) {
    *this = Word();
    if (s.empty() || s.size() > kMaxLength || new_begin > kMaxBegin) {
      return false;
    }
    uint32_t mask = 0;
    for (const char c : s) {
      if (!is_letter(c)) {
        return false;
      }
      mask |= letter_to_bit(c);
    }
    begin = new_begin;
    length = s.size();
    letters = mask;
    return true;
  }


  //
  // WordDB Public
  //

  WordDB::WordDB(const std::filesystem::path& path) {
    load(path);
  }

  bool WordDB::load(const std::filesystem::path& path) {
    const auto ext = path.extension();
    if (ext == ".pre") {
      return load_preproc(path);
    }
    if (ext == ".txt") {
      return load_word_list(path);
    }
    WPS_LOGE("unknown extension for %s. must be .txt or .pre", path.string().c_str());
    clear();
    return false;
  }

  bool WordDB::load_text(std::string_view text) {
    clear();
    process_word_list(text);
    loaded = true;
    return true;
  }

  bool WordDB::save(const std::filesystem::path& path) const {
    if (path.extension() != ".pre") {
      WPS_LOGE("extension must be .pre: %s", path.string().c_str());
      return false;
    }
    if (!loaded) {
      WPS_LOGE("nothing loaded to save to %s", path.string().c_str());
      return false;
    }

    auto fout = File(path.string().c_str(), "wb");
    if (!fout) {
      WPS_LOGE("could not open %s for writing", path.string().c_str());
      return false;
    }

    PreHeader header;
    header.stats = stats;
    bool ok = fwrite(&header, sizeof(header), 1, fout) == 1;
    if (ok && !words_buf.empty()) {
      ok = fwrite(words_buf.data(), sizeof(Word) * words_buf.size(), 1, fout) == 1;
    }
    if (ok && !text_buf.empty()) {
      ok = fwrite(text_buf.data(), text_buf.size(), 1, fout) == 1;
    }
    fout.close();

    if (!ok) {
      WPS_LOGE("write to %s failed", path.string().c_str());
      std::error_code ec;
      std::filesystem::remove(path, ec);
    }
    return ok;
  }

  MatchSet WordDB::solve(
    std::string_view pattern_text,
    const solver::LengthBounds& bounds,
    uint32_t limit) const
  {
    MatchSet matches;
    if (pattern_text.empty()) {
      return matches;
    }

    const auto counts = solver::LetterCounts::from_pattern(solver::normalize_pattern(pattern_text));
    const auto budget = counts.budget();

    for (uint32_t i = 0, n = size(); i < n; ++i) {
      const auto& w = words_buf[i];
      if (!bounds.contains(w.length) || w.length > budget) {
        continue;
      }
      // without wildcards every letter of the word has to be in the pattern.
      if (!counts.wildcards && (uint32_t(w.letters) & ~counts.letters)) {
        continue;
      }
      if (!solver::can_form(str(w), counts)) {
        continue;
      }
      matches.add(WordIdx(i));
      if (limit && matches.size() >= limit) {
        break;
      }
    }

    return matches;
  }

  std::string WordDB::hint(std::string_view pattern_text, const solver::LengthBounds& bounds) const {
    const auto matches = solve(pattern_text, bounds, 1);
    return matches.empty() ? std::string(solver::kNoHint) : solver::format_hint(str(matches.front()));
  }

  std::vector<std::string> WordDB::to_strings(const MatchSet& matches) const {
    std::vector<std::string> out;
    out.reserve(matches.size());
    for (const auto i : matches) {
      out.emplace_back(str(i));
    }
    return out;
  }

  bool WordDB::is_equivalent(const WordDB& rhs) const {
    return
      loaded == rhs.loaded &&
      !memcmp(&stats, &rhs.stats, sizeof(stats)) &&
      text_buf == rhs.text_buf &&
      words_buf.size() == rhs.words_buf.size() &&
      (words_buf.empty() || !memcmp(words_buf.data(), rhs.words_buf.data(), sizeof(Word) * words_buf.size()));
  }


  //
  // WordDB Private
  //

  bool WordDB::load_preproc(const std::filesystem::path& path) {
    clear();

    auto fin = File(path.string().c_str(), "rb");
    if (!fin) {
      return false;
    }

    const auto file_size = fin.size_bytes();
    PreHeader header;
    if (fread(&header, sizeof(header), 1, fin) != 1) {
      WPS_LOGE("%s: truncated header", path.string().c_str());
      return false;
    }
    if (header.magic != kPreMagic || header.version != kPreVersion) {
      WPS_LOGE("%s: not a word cache or wrong version", path.string().c_str());
      return false;
    }

    const auto& hs = header.stats;
    const auto expected_size =
      uint64_t(sizeof(header)) + uint64_t(sizeof(Word)) * hs.word_count + hs.size_bytes;
    if (expected_size != file_size) {
      WPS_LOGE("%s: size mismatch. expected %llu bytes, found %u",
        path.string().c_str(), (unsigned long long)expected_size, file_size);
      return false;
    }

    std::vector<Word> words(hs.word_count);
    std::string text(hs.size_bytes, '\0');
    if ((!words.empty() && fread(words.data(), sizeof(Word) * words.size(), 1, fin) != 1) ||
        (!text.empty() && fread(text.data(), text.size(), 1, fin) != 1)) {
      WPS_LOGE("%s: read failed", path.string().c_str());
      return false;
    }

    // records have to describe the text exactly.
    uint32_t max_length = 0;
    for (const auto& w : words) {
      Word check;
      if (size_t(w.begin) + w.length > text.size() ||
          !check.read_str(std::string_view(text.data() + w.begin, w.length), uint32_t(w.begin)) ||
          check.letters != w.letters) {
        WPS_LOGE("%s: corrupt word record", path.string().c_str());
        return false;
      }
      max_length = std::max(max_length, uint32_t(w.length));
    }
    if (max_length != hs.max_length) {
      WPS_LOGE("%s: inconsistent stats", path.string().c_str());
      return false;
    }

    stats = hs;
    words_buf = std::move(words);
    text_buf = std::move(text);
    loaded = true;
    return true;
  }

  bool WordDB::load_word_list(const std::filesystem::path& path) {
    clear();

    auto dict_file = File(path.string().c_str(), "rb");
    if (!dict_file) {
      return false;
    }

    std::string text(dict_file.size_bytes(), '\0');
    if (!text.empty()) {
      const size_t read_count = fread(text.data(), 1, text.size(), dict_file);
      if (!read_count) {
        WPS_LOGE("could not read %s", path.string().c_str());
        return false;
      }
      text.resize(read_count);
    }

    process_word_list(text);
    loaded = true;
    return true;
  }

  void WordDB::process_word_list(std::string_view text) {
    text_buf.reserve(text.size());

    std::string lowered;
    while (!text.empty()) {
      const auto eol = text.find('\n');
      const auto line = trim(text.substr(0, eol));
      text.remove_prefix(eol == std::string_view::npos ? text.size() : eol + 1);

      if (line.empty()) {
        continue;
      }

      lowered.assign(line);
      for (auto& c : lowered) {
        if (c >= 'A' && c <= 'Z') {
          c = char(c - 'A' + 'a');
        }
      }

      Word w;
      if (!w.read_str(lowered, uint32_t(text_buf.size()))) {
        ++stats.dropped_count;
        continue;
      }
      text_buf += lowered;
      words_buf.push_back(w);
      stats.max_length = std::max(stats.max_length, uint32_t(w.length));
    }

    text_buf.shrink_to_fit();
    stats.word_count = uint32_t(words_buf.size());
    stats.size_bytes = uint32_t(text_buf.size());

    if (stats.dropped_count) {
      WPS_LOGI("dropped %u entries that were not plain a-z words", stats.dropped_count);
    }
  }

  void WordDB::clear() {
    stats = {};
    text_buf.clear();
    words_buf.clear();
    loaded = false;
  }
}
