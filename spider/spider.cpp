#include "spider.hpp"
#include "../common/console.hpp"
#include "../common/errors.hpp"
#include "../html_parser/html_parser.hpp"
#include "contest.hpp"
#include <algorithm>
#include <map>
#include <thread>

namespace fs = std::filesystem;

size_t RunSummary::failures() const {
  return std::count_if(reports.begin(), reports.end(), [](const ProblemReport &r) { return !r.ok(); });
}

Spider::Spider(const IniParser &config, Fetcher fetcher)
    : config(config)
    , fetcher(std::move(fetcher))
    , writer(config.getOutputDir()) {
}

RunSummary Spider::run(const std::string &contest) {
  RunSummary summary;
  summary.contest_uri = resolve_contest_uri(contest, config.getBaseUrl());

  std::string html = fetch(summary.contest_uri, "contest page");
  try {
    problems = HtmlParser::extractProblems(html);
  } catch (const ParseError &) {
    if (config.getDumpMarkupOnError()) {
      console::dump(html);
    }
    throw;
  }

  console::info(console::format("Found ", problems.size(), " problems."));

  reports.assign(problems.size(), ProblemReport{});
  std::map<fs::path, size_t> directories;
  for (size_t i = 0; i < problems.size(); ++i) {
    reports[i].problem = problems[i];

    // Ids differing only in case share a directory; the first one keeps it
    auto [owner, inserted] = directories.emplace(writer.problemDir(problems[i]), i);
    if (!inserted) {
      reports[i].error = "Output directory " + owner->first.string() + " already belongs to problem " +
                         problems[owner->second];
      console::error("Problem " + problems[i] + " failed: " + reports[i].error);
      continue;
    }
    task_queue.push(i);
  }

  size_t num_threads = std::min<size_t>(config.getNumThreads(), task_queue.size());

  std::vector<std::thread> threads;
  for (size_t i = 0; i < num_threads; ++i) {
    threads.emplace_back(&Spider::worker, this, summary.contest_uri);
  }

  for (auto &t : threads) {
    t.join();
  }

  summary.reports = std::move(reports);
  reports.clear();
  return summary;
}

std::string Spider::fetch(const std::string &url, const std::string &what) {
  console::info("Retrieving " + url + " ...");
  std::string html = fetcher(url);
  console::info(console::format("Retrieved ", what, " (", html.size(), " bytes)."));
  return html;
}

void Spider::worker(const std::string &contest_uri) {
  for (;;) {
    size_t task;

    {
      std::lock_guard<std::mutex> lock(queue_mutex);
      if (task_queue.empty())
        break;

      task = task_queue.front();
      task_queue.pop();
    }

    process_problem(contest_uri, task);
  }
}

// Each task owns reports[index]
void Spider::process_problem(const std::string &contest_uri, size_t index) {
  const std::string &problem = problems[index];
  ProblemReport     &report  = reports[index];

  try {
    std::string html = fetch(problem_uri(contest_uri, problem), "problem " + problem);

    ProblemParser parser;
    try {
      parser.feed(HtmlParser::patchProblemHtml(html));
    } catch (const ParseError &) {
      if (config.getDumpMarkupOnError()) {
        console::dump(html);
      }
      throw;
    }

    if (parser.mismatchedEndTags() > 0) {
      console::warn(console::format("Problem ", problem, ": ", parser.mismatchedEndTags(),
                                    " end tags did not match the sample element they closed"));
    }

    std::vector<Example> examples = parser.getExamples();
    writer.write(problem, examples);

    report.examples = examples.size();
    console::info(console::format("Wrote ", examples.size(), " examples for problem ", problem, "."));
  } catch (const std::exception &e) {
    report.error = e.what();
    if (report.error.empty()) {
      report.error = "unknown error";
    }
    console::error("Problem " + problem + " failed: " + report.error);
  }
}
