#include "oauth/redirect_listener.hpp"

#include <boost/url/parse.hpp>
#include <boost/url/url_view.hpp>

#include <fmt/format.h>

#include <exception>

namespace fitbridge::oauth {

namespace urls = boost::urls;

namespace {

// The implicit grant returns the token in the fragment, which the browser
// keeps to itself. This page is the only way to get it back to the process.
constexpr std::string_view kBridgePage = R"html(<!DOCTYPE html>
<html>
<head>
  <meta charset="utf-8">
  <title>fit-bridge</title>
</head>
<body>
<p id="status">Reading authorization response...</p>
<script>
(function () {
  var statusEl = document.getElementById('status');
  var params = {};
  var hash = window.location.hash.substring(1);
  hash.split('&').forEach(function (pair) {
    var idx = pair.indexOf('=');
    if (idx > 0) {
      params[pair.substring(0, idx)] = decodeURIComponent(pair.substring(idx + 1));
    }
  });
  if (params['access_token'] && params['state']) {
    fetch('/token-received?token=' + encodeURIComponent(params['access_token']) +
          '&state=' + encodeURIComponent(params['state']))
      .then(function (response) { return response.text(); })
      .then(function (text) { statusEl.textContent = text; })
      .catch(function (err) { statusEl.textContent = 'Error: ' + err; });
  } else {
    statusEl.textContent = 'Error: Access token or state not found in the URL fragment.';
  }
})();
</script>
</body>
</html>
)html";

} // namespace

class RedirectListener::Session
    : public std::enable_shared_from_this<RedirectListener::Session> {
public:
  Session(tcp::socket socket, std::weak_ptr<RedirectListener> listener)
      : stream_(std::move(socket)), listener_(std::move(listener)) {
    parser_.body_limit(0);
    parser_.header_limit(16 * 1024);
  }

  void run() { do_read(); }

private:
  beast::tcp_stream stream_;
  beast::flat_buffer buffer_;
  http::request_parser<http::empty_body> parser_;
  std::weak_ptr<RedirectListener> listener_;

  void do_read() {
    auto self = shared_from_this();
    http::async_read(stream_, buffer_, parser_,
                     [self](boost::system::error_code ec, std::size_t) {
                       self->on_read(ec);
                     });
  }

  void on_read(const boost::system::error_code &ec) {
    if (ec) {
      close();
      return;
    }

    auto req = parser_.release();
    auto listener = listener_.lock();
    if (!listener) {
      close();
      return;
    }

    DEBUG_PRINT("redirect listener: " << req.method_string() << ' '
                                      << req.target());
    auto reply = listener->handle(req.method(), req.target());

    // Response must outlive the async_write.
    auto res = std::make_shared<http::response<http::string_body>>();
    res->version(req.version());
    res->result(reply.status);
    res->set(http::field::server, "fit-bridge");
    res->set(http::field::content_type, reply.content_type);
    res->set(http::field::cache_control, "no-store");
    res->keep_alive(false);
    if (req.method() == http::verb::head) {
      res->content_length(reply.body.size());
    } else {
      res->body() = std::move(reply.body);
      res->prepare_payload();
    }

    auto self = shared_from_this();
    http::async_write(stream_, *res,
                      [self, res](boost::system::error_code, std::size_t) {
                        self->close();
                      });
  }

  void close() {
    boost::system::error_code ignored;
    stream_.socket().shutdown(tcp::socket::shutdown_send, ignored);
    stream_.socket().close(ignored);
  }
};

RedirectListener::RedirectListener(ListenConfig listen,
                                   std::shared_ptr<AuthSession> session)
    : listen_(std::move(listen)), session_(std::move(session)), ioc_(1),
      acceptor_(net::make_strand(ioc_)) {
  work_guard_ = std::make_unique<
      net::executor_work_guard<net::io_context::executor_type>>(
      net::make_work_guard(ioc_));
  actual_port_.store(listen_.port);
}

RedirectListener::StartResult
RedirectListener::start(ListenConfig listen,
                        std::shared_ptr<AuthSession> session) {
  if (listen.bind.empty()) {
    return StartResult::Err(monad::make_error(
        my_errors::GENERAL::MISSING_FIELD, "listener bind address is required"));
  }
  if (!session) {
    return StartResult::Err(monad::make_error(
        my_errors::GENERAL::MISSING_FIELD, "listener needs an auth session"));
  }

  auto listener = std::shared_ptr<RedirectListener>(
      new RedirectListener(std::move(listen), std::move(session)));
  listener->weak_self_ = listener;

  auto r = listener->start_listening();
  if (r.is_err()) {
    return StartResult::Err(std::move(r).error());
  }

  listener->start_thread();
  return StartResult::Ok(std::move(listener));
}

void RedirectListener::stop() {
  const bool was_already_stopped = stopped_.exchange(true);

  if (!was_already_stopped) {
    if (auto self = weak_self_.lock()) {
      net::post(ioc_, [self = std::move(self)]() {
        self->close_acceptor();
        self->work_guard_.reset();
        self->ioc_.stop();
      });
    } else {
      // Destruction path: avoid shared_from_this().
      close_acceptor();
      work_guard_.reset();
      ioc_.stop();
    }
    BOOST_LOG_SEV(lg_, trivial::info) << "Redirect listener stopping";
  }

  if (thread_.joinable() && std::this_thread::get_id() != thread_.get_id()) {
    thread_.join();
  }
}

void RedirectListener::close_acceptor() {
  boost::system::error_code ec;
  acceptor_.cancel(ec);
  acceptor_.close(ec);
}

monad::MyVoidResult RedirectListener::start_listening() {
  boost::system::error_code ec;
  auto addr = net::ip::make_address(listen_.bind, ec);
  if (ec) {
    return monad::MyVoidResult::Err(
        monad::make_error(my_errors::GENERAL::INVALID_ARGUMENT,
                          "Invalid bind address: " + ec.message()));
  }

  tcp::endpoint ep{addr, listen_.port};
  acceptor_.open(ep.protocol(), ec);
  if (!ec) {
    acceptor_.set_option(net::socket_base::reuse_address(true), ec);
  }
  if (!ec) {
    acceptor_.bind(ep, ec);
  }
  if (!ec) {
    acceptor_.listen(net::socket_base::max_listen_connections, ec);
  }
  if (ec) {
    return monad::MyVoidResult::Err(monad::make_error(
        my_errors::NETWORK::LISTEN_FAILED,
        fmt::format("Failed to bind/listen {}:{}: {}", listen_.bind,
                    listen_.port, ec.message())));
  }

  const auto local = acceptor_.local_endpoint(ec);
  actual_port_.store(ec ? listen_.port : local.port());

  do_accept();

  BOOST_LOG_SEV(lg_, trivial::info)
      << "Redirect listener on " << listen_.bind << ':' << actual_port_.load();
  return monad::MyVoidResult::Ok();
}

void RedirectListener::start_thread() {
  thread_ = std::thread([this]() {
    try {
      ioc_.run();
    } catch (const std::exception &ex) {
      BOOST_LOG_SEV(lg_, trivial::error)
          << "Redirect listener thread terminated: " << ex.what();
    }
  });
}

void RedirectListener::do_accept() {
  acceptor_.async_accept(
      net::make_strand(ioc_),
      [this](boost::system::error_code ec, tcp::socket socket) {
        if (ec) {
          if (ec != net::error::operation_aborted) {
            BOOST_LOG_SEV(lg_, trivial::warning)
                << "Redirect listener accept failed: " << ec.message();
          }
          return;
        }

        std::make_shared<Session>(std::move(socket), weak_self_)->run();

        if (!stopped_.load()) {
          do_accept();
        }
      });
}

RedirectListener::Reply RedirectListener::handle(http::verb method,
                                                 std::string_view target) {
  if (method != http::verb::get && method != http::verb::head) {
    return {http::status::not_found, "text/plain", "not found"};
  }

  auto parsed = urls::parse_origin_form(target);
  if (!parsed) {
    return {http::status::bad_request, "text/plain", "bad request"};
  }
  const std::string path = parsed->path();

  if (path == kCallbackPath) {
    BOOST_LOG_SEV(lg_, trivial::debug) << "Serving redirect bridge page";
    return {http::status::ok, "text/html; charset=utf-8",
            std::string(kBridgePage)};
  }
  if (path == kTokenReceivedPath) {
    return handle_token_received(target);
  }
  return {http::status::not_found, "text/plain", "not found"};
}

RedirectListener::Reply
RedirectListener::handle_token_received(std::string_view target) {
  urls::url_view u = urls::parse_origin_form(target).value();

  std::string token;
  std::string state;
  for (const auto &param : u.params()) {
    if (param.key == "token" && token.empty()) {
      token = param.value;
    } else if (param.key == "state" && state.empty()) {
      state = param.value;
    }
  }

  const auto outcome = session_->complete(token, state);
  switch (outcome) {
  case RedirectOutcome::Accepted:
    BOOST_LOG_SEV(lg_, trivial::info)
        << "Access token received; state matches the authorization request";
    return {http::status::ok, "text/plain", std::string(kStateMatchesMessage)};
  case RedirectOutcome::MissingToken:
    BOOST_LOG_SEV(lg_, trivial::warning) << "Redirect carried no token";
    return {http::status::ok, "text/plain", std::string(kNoTokenMessage)};
  case RedirectOutcome::StateMismatch:
    BOOST_LOG_SEV(lg_, trivial::warning)
        << "Redirect state does not match; ignoring token";
    return {http::status::ok, "text/plain",
            std::string(kStateMismatchMessage)};
  case RedirectOutcome::AlreadyCompleted:
    BOOST_LOG_SEV(lg_, trivial::debug)
        << "Duplicate redirect after completion ignored";
    return {http::status::ok, "text/plain",
            std::string(kAlreadyCompletedMessage)};
  }
  return {http::status::internal_server_error, "text/plain", "unexpected"};
}

} // namespace fitbridge::oauth
