#include "http_utils.hpp"
#include "../common/errors.hpp"
#include "../common/ini_parser.hpp"
#include <boost/algorithm/string/case_conv.hpp>
#include <boost/asio/connect.hpp>
#include <boost/asio/ip/tcp.hpp>
#include <boost/asio/ssl/error.hpp>
#include <boost/asio/ssl/host_name_verification.hpp>
#include <boost/asio/ssl/stream.hpp>
#include <boost/beast.hpp>
#include <boost/beast/ssl.hpp>
#include <boost/regex.hpp>
#include <chrono>

namespace net = boost::asio;
namespace beast = boost::beast;
namespace http = beast::http;
namespace ssl = net::ssl;
using tcp = net::ip::tcp;

namespace {

struct Response {
  http::status status;
  std::string location;
  std::string body;
};

bool is_default_port(const ParsedUrl &url) {
  return (url.scheme == "http" && url.port == "80") ||
         (url.scheme == "https" && url.port == "443");
}

std::string origin_of(const ParsedUrl &url) {
  std::string result = url.scheme + "://" + url.host;
  if (!is_default_port(url)) {
    result += ":" + url.port;
  }
  return result;
}

template <class Stream>
Response exchange(Stream &stream, const ParsedUrl &url,
                  const DownloadOptions &options) {
  // Фрагмент не отправляется на сервер
  std::string target = url.path.substr(0, url.path.find('#'));
  http::request<http::string_body> req{http::verb::get, target, 11};
  req.set(http::field::host,
          is_default_port(url) ? url.host : url.host + ":" + url.port);
  req.set(http::field::user_agent, options.user_agent);
  req.set(http::field::connection, "close");

  http::write(stream, req);

  beast::flat_buffer buffer;
  http::response_parser<http::string_body> parser;
  parser.body_limit(64 * 1024 * 1024);
  http::read(stream, buffer, parser);

  auto &res = parser.get();
  Response response{res.result(), "", std::move(res.body())};
  if (auto location = res.find(http::field::location); location != res.end()) {
    response.location = std::string(location->value());
  }
  return response;
}

Response fetch_once(const ParsedUrl &url, const DownloadOptions &options) {
  net::io_context ioc;
  tcp::resolver resolver(ioc);
  auto results = resolver.resolve(url.host, url.port);

  const auto connect_timeout = std::chrono::seconds(options.connect_timeout);
  const auto operation_timeout =
      std::chrono::seconds(options.operation_timeout);

  if (url.scheme == "https") {
    ssl::context ctx(ssl::context::tlsv12_client);
    ctx.set_default_verify_paths();
    ctx.set_verify_mode(options.verify_certificates ? ssl::verify_peer
                                                    : ssl::verify_none);

    beast::ssl_stream<beast::tcp_stream> stream(ioc, ctx);
    if (options.verify_certificates) {
      stream.set_verify_callback(ssl::host_name_verification(url.host));
    }

    // Устанавливаем таймаут на соединение
    beast::get_lowest_layer(stream).expires_after(connect_timeout);

    if (!SSL_set_tlsext_host_name(stream.native_handle(), url.host.c_str())) {
      beast::error_code ec{static_cast<int>(::ERR_get_error()),
                           net::error::get_ssl_category()};
      throw beast::system_error{ec};
    }

    beast::get_lowest_layer(stream).connect(results);

    // Устанавливаем таймаут на операции
    beast::get_lowest_layer(stream).expires_after(operation_timeout);
    stream.handshake(ssl::stream_base::client);

    Response response = exchange(stream, url, options);

    beast::error_code ec;
    beast::get_lowest_layer(stream).socket().shutdown(
        tcp::socket::shutdown_both, ec);
    return response;
  }

  beast::tcp_stream stream(ioc);

  stream.expires_after(connect_timeout);
  stream.connect(results);

  stream.expires_after(operation_timeout);
  Response response = exchange(stream, url, options);

  beast::error_code ec;
  stream.socket().shutdown(tcp::socket::shutdown_both, ec);
  return response;
}

bool is_redirect(http::status status) {
  return status == http::status::moved_permanently ||
         status == http::status::found ||
         status == http::status::see_other ||
         status == http::status::temporary_redirect ||
         status == http::status::permanent_redirect;
}

} // namespace

DownloadOptions DownloadOptions::fromConfig(const IniParser &config) {
  DownloadOptions options;
  options.user_agent = config.getUserAgent();
  options.connect_timeout = config.getConnectTimeout();
  options.operation_timeout = config.getOperationTimeout();
  options.max_redirects = config.getMaxRedirects();
  options.verify_certificates = config.getVerifyCertificates();
  return options;
}

// Функция для корректного разрешения относительных URL
std::string resolve_url(const std::string &base, const std::string &location) {
  // Абсолютный URL
  if (location.find("://") != std::string::npos) {
    return location;
  }

  ParsedUrl base_parsed = parse_url(base);

  // URL относительно схемы (//example.com/path)
  if (location.size() >= 2 && location[0] == '/' && location[1] == '/') {
    return base_parsed.scheme + ":" + location;
  }

  // Абсолютный путь (/path)
  if (!location.empty() && location[0] == '/') {
    return origin_of(base_parsed) + location;
  }

  std::string directory = base_parsed.path;
  size_t query = directory.find_first_of("?#");
  if (query != std::string::npos) {
    directory.erase(query);
  }

  // Только запрос (?x=1): путь базы сохраняется
  if (!location.empty() && location[0] == '?') {
    return origin_of(base_parsed) + directory + location;
  }

  // Только фрагмент (#y): сохраняются путь и запрос базы
  if (!location.empty() && location[0] == '#') {
    return origin_of(base_parsed) +
           base_parsed.path.substr(0, base_parsed.path.find('#')) + location;
  }

  // Относительный путь (path)
  size_t last_slash = directory.find_last_of('/');
  if (last_slash == std::string::npos) {
    return origin_of(base_parsed) + "/" + location;
  }
  return origin_of(base_parsed) + directory.substr(0, last_slash + 1) +
         location;
}

std::string download(const std::string &url, const DownloadOptions &options) {
  std::string current_url = url;

  for (int redirect_count = 0;; ++redirect_count) {
    ParsedUrl parsed_url = parse_url(current_url);
    if (parsed_url.scheme != "http" && parsed_url.scheme != "https") {
      throw FetchError(current_url, "Unsupported URL scheme '" +
                                        parsed_url.scheme + "'");
    }

    Response response;
    try {
      response = fetch_once(parsed_url, options);
    } catch (const beast::system_error &e) {
      throw FetchError(current_url, std::string("Download error: ") + e.what());
    }

    // Обработка редиректов с разрешением URL
    if (is_redirect(response.status) && !response.location.empty()) {
      if (redirect_count >= options.max_redirects) {
        throw FetchError(url, "Too many redirects");
      }
      current_url = resolve_url(current_url, response.location);
      continue;
    }

    if (response.status != http::status::ok) {
      throw FetchError(current_url,
                       "HTTP error " +
                           std::to_string(static_cast<unsigned>(response.status)));
    }
    return std::move(response.body);
  }
}

ParsedUrl parse_url(const std::string &url) {
  ParsedUrl result;
  static const boost::regex re(R"(^([a-z]+):\/\/([^/:?#]+)(?::(\d+))?([/?#].*)?$)",
                               boost::regex::icase);
  boost::smatch match;

  if (boost::regex_match(url, match, re)) {
    result.scheme = match[1].str();
    boost::algorithm::to_lower(result.scheme);
    result.host = match[2].str();

    if (match[3].matched) {
      result.port = match[3].str();
    }

    if (match[4].matched) {
      result.path = match[4].str();
      if (result.path[0] != '/') {
        result.path = "/" + result.path;
      }
    } else {
      result.path = "/";
    }

    // Установка портов по умолчанию
    if (result.scheme == "https" && result.port.empty()) {
      result.port = "443";
    } else if (result.scheme == "http" && result.port.empty()) {
      result.port = "80";
    }
  } else {
    // Возвращаем unsupported scheme для некорректных URL
    result.scheme = "unsupported";
    result.host = "";
    result.port = "";
    result.path = "";
  }
  return result;
}
