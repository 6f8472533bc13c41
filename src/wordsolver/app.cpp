#include "app.h"
#include <optional>
#include <string>

namespace wps::app {
  using namespace word_db;

  namespace {
    void print_matches(const WordDB& wordDB, const MatchSet& matches, uint32_t limit, FILE* out) {
      const auto count = uint32_t(matches.size());
      const auto shown = (limit && limit < count) ? limit : count;

      if (shown < count) {
        fprintf(out, "%u possible words (showing %u)\n======================\n", count, shown);
      }
      else {
        fprintf(out, "%u possible words\n======================\n", count);
      }

      // words can be longer than any format buffer.
      for (uint32_t i = 0; i < shown; ++i) {
        const auto s = wordDB.str(matches[i]);
        fputs("    ", out);
        fwrite(s.data(), 1, s.size(), out);
        fputc('\n', out);
      }
    }
  }

  bool load_default_db(WordDB& wordDB, const std::filesystem::path& dir, bool timing) {
    const auto txt_path = dir / kDefaultListName;
    const auto pre_path = dir / kDefaultCacheName;

    std::error_code ec;
    if (std::filesystem::exists(pre_path, ec) && wordDB.load(pre_path)) {
      return true;
    }

    if (!wordDB.load(txt_path)) {
      return false;
    }

    std::optional<ScopedTimer> save_timer;
    if (timing) {
      WPS_PRINT("pre-processing %s to %s.\n", txt_path.string().c_str(), pre_path.string().c_str());
      save_timer.emplace(__FILE__, __LINE__, "wrote word cache");
    }
    if (!wordDB.save(pre_path)) {
      WPS_LOGE("could not write %s. continuing without a cache.", pre_path.string().c_str());
    }
    return true;
  }

  void run_pattern(
    const WordDB& wordDB,
    const Options& opts,
    std::string_view pattern_text,
    bool want_hint,
    FILE* out)
  {
    // nothing to search for, the same as an empty text box.
    if (solver::normalize_pattern(pattern_text).empty()) {
      return;
    }

    if (want_hint) {
      const auto h = wordDB.hint(pattern_text, opts.bounds);
      fprintf(out, "Hint: %s\n", h.c_str());
    }
    else {
      print_matches(wordDB, wordDB.solve(pattern_text, opts.bounds), opts.limit, out);
    }
  }

  void run_lines(const WordDB& wordDB, const Options& opts, std::istream& in, FILE* out) {
    std::string line;
    while (std::getline(in, line)) {
      if (!line.empty() && line[0] == '?') {
        run_pattern(wordDB, opts, std::string_view(line).substr(1), true, out);
      }
      else {
        run_pattern(wordDB, opts, line, opts.hint, out);
      }
    }
  }

  int run(const Options& opts, const std::filesystem::path& exe_dir, std::istream& in, FILE* out, FILE* err) {
    auto total_timer = ScopedTimer();
    double preload_ms = 0;

    WordDB wordDB;

    // load word database
    {
      auto preload_timer = ScopedTimer();
      const bool ok = opts.dict_path.empty()
        ? load_default_db(wordDB, exe_dir, opts.timing)
        : wordDB.load(opts.dict_path);
      preload_ms = preload_timer.elapsed_ms();

      if (!ok) {
        const auto path = opts.dict_path.empty() ? exe_dir / kDefaultListName : opts.dict_path;
        fprintf(err, "Failed to load dictionary %s.\n", path.string().c_str());
        return 1;
      }
    }

    auto solution_timer = ScopedTimer();
    if (!opts.patterns.empty()) {
      for (const auto& pattern : opts.patterns) {
        run_pattern(wordDB, opts, pattern, opts.hint, out);
      }
    }
    else {
      run_lines(wordDB, opts, in, out);
    }
    const double solution_ms = solution_timer.elapsed_ms();

    if (opts.timing) {
      fprintf(out, "\n%u words loaded\npreload_time: %lgms  solution time: %lgms  total_time: %lgms\n",
        wordDB.size(), preload_ms, solution_ms, total_timer.elapsed_ms());
    }
    fflush(out);

    return 0;
  }
} // namespace wps::app
