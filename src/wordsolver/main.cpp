#include "core/core.h"
#include "wordsolver/app.h"
#include "wordsolver/options.h"
#include <iostream>

int main(int argc, char** argv) {
  using namespace wps;

  app::Options opts;
  std::string error;
  if (!app::parse_options(argc, argv, opts, error)) {
    WPS_LOGE("%s", error.c_str());
    WPS_PUTE(app::usage());
    return 1;
  }
  if (opts.help) {
    WPS_PUTI(app::usage());
    return 0;
  }

  return app::run(opts, std::filesystem::path(argv[0]).parent_path(), std::cin, stdout, stderr);
}
