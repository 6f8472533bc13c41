#pragma once
#include "core/core.h"
#include "solver/solver.h"
#include <filesystem>
#include <string>
#include <vector>

namespace wps::app {
  using namespace core;

  struct Options {
    solver::LengthBounds bounds = solver::LengthBounds::from_text("", "");
    // empty means words_alpha beside the executable.
    std::filesystem::path dict_path;
    std::vector<std::string> patterns;
    uint32_t limit = 0;
    bool hint = false;
    bool timing = false;
    bool help = false;
  };

  const char* usage();

  // false with a message in error on an unknown flag or a missing value.
  bool parse_options(int argc, const char* const* argv, Options& opts, std::string& error);
} // namespace wps::app
