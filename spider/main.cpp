#include "../common/console.hpp"
#include "../common/ini_parser.hpp"
#include "http_utils.hpp"
#include "spider.hpp"
#include <cstdlib>
#include <filesystem>
#include <iostream>
#include <stdexcept>

static void print_usage(std::ostream &out, const char *program) {
  out << "Usage: " << program << " <contest>\n"
      << "\n"
      << "Downloads the sample tests of every problem in a Codeforces contest.\n"
      << "\n"
      << "  contest     URI or numerical ID of the contest to scrape\n"
      << "  -h, --help  show this message\n"
      << "\n"
      << "Settings are read from $CF_SCRAPER_CONFIG or ./cf_scraper.ini when present.\n";
}

static IniParser load_config() {
  if (const char *path = std::getenv("CF_SCRAPER_CONFIG"); path && *path) {
    return IniParser(path);
  }
  if (std::filesystem::exists("cf_scraper.ini")) {
    return IniParser("cf_scraper.ini");
  }
  return IniParser();
}

int main(int argc, char **argv) {
  for (int i = 1; i < argc; ++i) {
    std::string arg = argv[i];
    if (arg == "-h" || arg == "--help") {
      print_usage(std::cout, argv[0]);
      return 0;
    }
  }

  if (argc != 2) {
    print_usage(std::cerr, argv[0]);
    return 1;
  }

  try {
    IniParser       config  = load_config();
    DownloadOptions options = DownloadOptions::fromConfig(config);

    Spider     spider(config, [options](const std::string &url) { return download(url, options); });
    RunSummary summary = spider.run(argv[1]);

    console::info(console::format("Done: ", summary.reports.size() - summary.failures(), " of ",
                                  summary.reports.size(), " problems succeeded."));
    for (const auto &report : summary.reports) {
      if (!report.ok()) {
        console::error(report.problem + ": " + report.error);
      }
    }
    return summary.ok() ? 0 : 1;
  } catch (const std::exception &e) {
    std::cerr << "Fatal error: " << e.what() << std::endl;
    return 1;
  }
}
