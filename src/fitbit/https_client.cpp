#include "fitbit/https_client.hpp"

#include <boost/asio/ip/tcp.hpp>
#include <boost/asio/ssl/host_name_verification.hpp>
#include <boost/beast/core.hpp>
#include <boost/beast/http.hpp>
#include <boost/beast/ssl.hpp>
#include <boost/url/parse.hpp>
#include <boost/url/url_view.hpp>

#include <fmt/format.h>
#include <openssl/err.h>

#include "my_error_codes.hpp"

namespace fitbridge::fitbit {

namespace beast = boost::beast;
namespace http = boost::beast::http;
namespace urls = boost::urls;
using tcp = boost::asio::ip::tcp;

namespace {

struct Target {
  bool tls{true};
  std::string host;
  std::string port;
  std::string path;
};

monad::MyResult<Target> parse_target(const std::string &url) {
  auto parsed = urls::parse_uri(url);
  if (!parsed) {
    return monad::MyResult<Target>::Err(
        monad::make_error(my_errors::GENERAL::INVALID_ARGUMENT,
                          "Invalid URL '" + url + "': " +
                              parsed.error().message()));
  }
  const urls::url_view &u = *parsed;
  Target t;
  if (u.scheme() == "https") {
    t.tls = true;
  } else if (u.scheme() == "http") {
    t.tls = false;
  } else {
    return monad::MyResult<Target>::Err(monad::make_error(
        my_errors::GENERAL::INVALID_ARGUMENT,
        "Unsupported URL scheme: " + std::string(u.scheme())));
  }
  t.host = u.host();
  t.port = u.has_port() ? std::string(u.port()) : (t.tls ? "443" : "80");
  t.path = std::string(u.encoded_path());
  if (t.path.empty()) {
    t.path = "/";
  }
  if (u.has_query()) {
    t.path += "?";
    t.path += std::string(u.encoded_query());
  }
  return monad::MyResult<Target>::Ok(std::move(t));
}

monad::MyResult<HttpResponse> network_error(int code, const char *stage,
                                            const Target &t,
                                            const beast::error_code &ec) {
  return monad::MyResult<HttpResponse>::Err(monad::make_error(
      code, fmt::format("{} {}:{} failed: {}", stage, t.host, t.port,
                        ec.message())));
}

template <typename Stream>
monad::MyResult<HttpResponse>
exchange(Stream &stream, const Target &t,
         const std::map<std::string, std::string> &headers,
         std::size_t body_limit) {
  http::request<http::empty_body> req{http::verb::get, t.path, 11};
  req.set(http::field::host, t.host);
  req.set(http::field::user_agent, "fit-bridge");
  req.set(http::field::accept, "*/*");
  for (const auto &[name, value] : headers) {
    req.set(name, value);
  }

  beast::error_code ec;
  http::write(stream, req, ec);
  if (ec) {
    return network_error(my_errors::NETWORK::WRITE_ERROR, "write", t, ec);
  }

  beast::flat_buffer buffer;
  http::response_parser<http::string_body> parser;
  parser.body_limit(body_limit);
  http::read(stream, buffer, parser, ec);
  if (ec) {
    return network_error(my_errors::NETWORK::READ_ERROR, "read", t, ec);
  }

  auto res = parser.release();
  HttpResponse out;
  out.status = res.result_int();
  out.content_type = std::string(res[http::field::content_type]);
  out.body = std::move(res.body());
  return monad::MyResult<HttpResponse>::Ok(std::move(out));
}

} // namespace

HttpsClient::HttpsClient() : ssl_ctx_(ssl::context::tls_client) {
  ssl_ctx_.set_default_verify_paths();
  ssl_ctx_.set_verify_mode(ssl::verify_peer);
}

monad::MyResult<HttpResponse>
HttpsClient::get(const std::string &url,
                 const std::map<std::string, std::string> &headers) {
  auto target = parse_target(url);
  if (target.is_err()) {
    return monad::MyResult<HttpResponse>::Err(std::move(target).error());
  }
  const Target &t = target.value();

  beast::error_code ec;
  tcp::resolver resolver(ioc_);
  auto endpoints = resolver.resolve(t.host, t.port, ec);
  if (ec) {
    return network_error(my_errors::NETWORK::CONNECT_ERROR, "resolve", t, ec);
  }

  BOOST_LOG_SEV(lg_, trivial::debug) << "GET " << t.host << t.path;

  if (!t.tls) {
    beast::tcp_stream stream(ioc_);
    stream.connect(endpoints, ec);
    if (ec) {
      return network_error(my_errors::NETWORK::CONNECT_ERROR, "connect", t,
                           ec);
    }
    auto r = exchange(stream, t, headers, body_limit_);
    stream.socket().shutdown(tcp::socket::shutdown_both, ec);
    return r;
  }

  beast::ssl_stream<beast::tcp_stream> stream(ioc_, ssl_ctx_);
  if (!SSL_set_tlsext_host_name(stream.native_handle(), t.host.c_str())) {
    beast::error_code sni_ec{static_cast<int>(::ERR_get_error()),
                             net::error::get_ssl_category()};
    return network_error(my_errors::NETWORK::SSL_ERROR, "SNI", t, sni_ec);
  }
  stream.set_verify_callback(ssl::host_name_verification(t.host));

  beast::get_lowest_layer(stream).connect(endpoints, ec);
  if (ec) {
    return network_error(my_errors::NETWORK::CONNECT_ERROR, "connect", t, ec);
  }
  stream.handshake(ssl::stream_base::client, ec);
  if (ec) {
    return network_error(my_errors::NETWORK::SSL_HANDSHAKE_ERROR,
                         "TLS handshake with", t, ec);
  }

  auto r = exchange(stream, t, headers, body_limit_);

  // Servers commonly drop the connection without close_notify.
  stream.shutdown(ec);
  if (ec && ec != net::error::eof && ec != ssl::error::stream_truncated) {
    BOOST_LOG_SEV(lg_, trivial::debug)
        << "TLS shutdown with " << t.host << ": " << ec.message();
  }
  return r;
}

} // namespace fitbridge::fitbit
