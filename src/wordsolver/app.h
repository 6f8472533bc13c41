#pragma once
#include "core/core.h"
#include "word_db/word_db.h"
#include "wordsolver/options.h"
#include <filesystem>
#include <istream>
#include <string_view>

namespace wps::app {
  using namespace core;

  constexpr const char* kDefaultListName = "words_alpha.txt";
  constexpr const char* kDefaultCacheName = "words_alpha.pre";

  // words_alpha.pre in dir, else words_alpha.txt in dir which is then cached as .pre.
  bool load_default_db(word_db::WordDB& wordDB, const std::filesystem::path& dir, bool timing);

  // prints a match list or a hint to out. patterns that normalize to nothing print nothing.
  void run_pattern(
    const word_db::WordDB& wordDB,
    const Options& opts,
    std::string_view pattern_text,
    bool want_hint,
    FILE* out);

  // one pattern per line. a leading ? asks for a hint.
  void run_lines(const word_db::WordDB& wordDB, const Options& opts, std::istream& in, FILE* out);

  // everything after option parsing. exe_dir is where the default word list lives.
  // returns the process exit status.
  int run(const Options& opts, const std::filesystem::path& exe_dir, std::istream& in, FILE* out, FILE* err);
} // namespace wps::app
