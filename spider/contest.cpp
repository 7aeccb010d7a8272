#include "contest.hpp"
#include <boost/regex.hpp>

std::string resolve_contest_uri(const std::string &contest, const std::string &base_url) {
  static const boost::regex number_re(R"(^\s*\+?0*([1-9]\d*)\s*$)");
  boost::smatch             match;
  if (boost::regex_match(contest, match, number_re)) {
    return base_url + "/contest/" + match[1].str();
  }

  std::string uri = contest;
  while (uri.size() > 1 && uri.back() == '/') {
    uri.pop_back();
  }
  return uri;
}

std::string problem_uri(const std::string &contest_uri, const std::string &problem) {
  return contest_uri + "/problem/" + problem;
}
