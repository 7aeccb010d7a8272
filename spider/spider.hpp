#pragma once
#include "../common/ini_parser.hpp"
#include "example_writer.hpp"
#include <functional>
#include <mutex>
#include <queue>
#include <string>
#include <vector>

using Fetcher = std::function<std::string(const std::string &url)>;

struct ProblemReport {
  std::string problem;
  size_t      examples = 0;
  std::string error;

  bool ok() const {
    return error.empty();
  }
};

struct RunSummary {
  std::string                contest_uri;
  std::vector<ProblemReport> reports;

  size_t failures() const;
  bool   ok() const {
    return failures() == 0;
  }
};

class Spider {
public:
  Spider(const IniParser &config, Fetcher fetcher);

  // Errors on the contest page propagate; each problem gets its own report
  RunSummary run(const std::string &contest);

private:
  const IniParser           &config;
  Fetcher                    fetcher;
  ExampleWriter              writer;
  std::queue<size_t>         task_queue;
  std::mutex                 queue_mutex;
  std::vector<std::string>   problems;
  std::vector<ProblemReport> reports;

  std::string fetch(const std::string &url, const std::string &what);
  void        worker(const std::string &contest_uri);
  void        process_problem(const std::string &contest_uri, size_t index);
};
