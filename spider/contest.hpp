#pragma once
#include <string>

// A bare positive number becomes <base_url>/contest/<n>, anything else is used as given
std::string resolve_contest_uri(const std::string &contest, const std::string &base_url);

std::string problem_uri(const std::string &contest_uri, const std::string &problem);
