#include "options.h"

namespace wps::app {
  const char* usage() {
    return
      "usage: wordsolver [options] [pattern...]\n"
      "  e.g. wordsolver c*t\n"
      "  letters may be used at most once each, * stands for any one letter.\n"
      "  with no pattern, patterns are read one per line from stdin. prefix a line with ? for a hint.\n"
      "\n"
      "  -m, --min N       minimum word length (default 1)\n"
      "  -M, --max N       maximum word length (default unbounded)\n"
      "  -d, --dict PATH   word list (.txt) or preprocessed cache (.pre)\n"
      "  -H, --hint        print a hint instead of the matches\n"
      "  -l, --limit N     print at most N matches (0 = all)\n"
      "  -t, --timing      print load and solve times\n"
      "  -h, --help        this text\n";
  }

  bool parse_options(int argc, const char* const* argv, Options& opts, std::string& error) {
    std::string min_text;
    std::string max_text;

    auto is = [](const char* arg, const char* short_name, const char* long_name) {
      return !strcmp(arg, short_name) || !strcmp(arg, long_name);
    };

    for (int i = 1; i < argc; ++i) {
      const char* arg = argv[i];

      // flags that take a value.
      const bool takes_value =
        is(arg, "-m", "--min") || is(arg, "-M", "--max") ||
        is(arg, "-d", "--dict") || is(arg, "-l", "--limit");
      if (takes_value) {
        if (i + 1 >= argc) {
          error = std::string("missing value for ") + arg;
          return false;
        }
        const char* value = argv[++i];
        if (is(arg, "-m", "--min")) {
          min_text = value;
        }
        else if (is(arg, "-M", "--max")) {
          max_text = value;
        }
        else if (is(arg, "-d", "--dict")) {
          opts.dict_path = value;
        }
        else {
          const auto limit = solver::parse_bound(value);
          if (!limit || *limit < 0) {
            error = std::string("bad limit ") + value;
            return false;
          }
          opts.limit = uint32_t(*limit);
        }
        continue;
      }

      if (is(arg, "-H", "--hint")) {
        opts.hint = true;
      }
      else if (is(arg, "-t", "--timing")) {
        opts.timing = true;
      }
      else if (is(arg, "-h", "--help")) {
        opts.help = true;
      }
      else if (!strcmp(arg, "--")) {
        for (++i; i < argc; ++i) {
          opts.patterns.emplace_back(argv[i]);
        }
      }
      else if (arg[0] == '-' && arg[1] && arg[1] != '*') {
        error = std::string("unknown option ") + arg;
        return false;
      }
      else {
        opts.patterns.emplace_back(arg);
      }
    }

    opts.bounds = solver::LengthBounds::from_text(min_text, max_text);
    return true;
  }
} // namespace wps::app
