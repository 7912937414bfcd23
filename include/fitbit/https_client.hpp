#pragma once

#include <cstddef>
#include <map>
#include <string>

#include <boost/asio/io_context.hpp>
#include <boost/asio/ssl.hpp>

#include "result_monad.hpp"
#include "util/my_logging.hpp"

namespace fitbridge::fitbit {

namespace net = boost::asio;
namespace ssl = boost::asio::ssl;

struct HttpResponse {
  unsigned status{0};
  std::string content_type;
  std::string body;

  bool ok() const { return status >= 200 && status < 300; }
};

// Blocking one-request-per-connection GET client. https URLs are verified
// against the system trust store with SNI and host name checks; plain http is
// accepted for loopback test servers.
class HttpsClient {
public:
  HttpsClient();

  monad::MyResult<HttpResponse>
  get(const std::string &url,
      const std::map<std::string, std::string> &headers = {});

private:
  net::io_context ioc_;
  ssl::context ssl_ctx_;
  std::size_t body_limit_{32 * 1024 * 1024};
  src::severity_logger<trivial::severity_level> lg_;
};

} // namespace fitbridge::fitbit
