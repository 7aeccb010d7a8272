#pragma once

#include <string>

class IniParser;

struct ParsedUrl {
    std::string scheme;
    std::string host;
    std::string port;
    std::string path;
};

struct DownloadOptions {
    std::string user_agent = "Mozilla/5.0 (compatible; cf_scraper/1.0)";
    int connect_timeout = 10;
    int operation_timeout = 30;
    int max_redirects = 5;
    bool verify_certificates = true;

    static DownloadOptions fromConfig(const IniParser &config);
};

// Returns the body of a 200 response; throws FetchError otherwise
std::string download(const std::string &url, const DownloadOptions &options = {});
ParsedUrl parse_url(const std::string &url);
std::string resolve_url(const std::string &base, const std::string &location);
