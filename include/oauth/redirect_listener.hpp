#pragma once

#include <atomic>
#include <cstdint>
#include <memory>
#include <string>
#include <string_view>
#include <thread>

#include <boost/asio.hpp>
#include <boost/beast/core.hpp>
#include <boost/beast/http.hpp>

#include "my_error_codes.hpp"
#include "oauth/auth_session.hpp"
#include "result_monad.hpp"
#include "util/my_logging.hpp"

namespace fitbridge::oauth {

namespace net = boost::asio;
namespace beast = boost::beast;
namespace http = boost::beast::http;
using tcp = boost::asio::ip::tcp;

inline constexpr std::uint16_t kRedirectPort = 8080;
inline constexpr std::string_view kCallbackPath = "/callback";
inline constexpr std::string_view kTokenReceivedPath = "/token-received";

inline constexpr std::string_view kStateMatchesMessage =
    "Token received. State matches with the one sent in auth URL.";
inline constexpr std::string_view kNoTokenMessage = "No token received.";
inline constexpr std::string_view kStateMismatchMessage =
    "The redirect request did not originate from this app.";
inline constexpr std::string_view kAlreadyCompletedMessage =
    "Authorization already completed.";

// Local endpoint the authorization server redirects the browser to. It
// serves two paths:
//
//   /callback        a static page whose script lifts access_token and state
//                    out of the URL fragment (never sent to a server) and
//                    re-issues them as query parameters to /token-received
//   /token-received  correlates token and state with the AuthSession
//
// The listener owns one io_context thread. stop() is idempotent; it joins the
// thread unless called from that thread.
class RedirectListener : public std::enable_shared_from_this<RedirectListener> {
public:
  struct ListenConfig {
    std::string bind{"127.0.0.1"};
    std::uint16_t port{kRedirectPort};
  };

  struct Reply {
    http::status status{http::status::ok};
    std::string content_type;
    std::string body;
  };

  using StartResult = monad::MyResult<std::shared_ptr<RedirectListener>>;

  static StartResult start(ListenConfig listen,
                           std::shared_ptr<AuthSession> session);

  ~RedirectListener() { stop(); }

  std::string bind() const { return listen_.bind; }
  std::uint16_t port() const { return actual_port_.load(); }
  bool is_stopped() const { return stopped_.load(); }

  void stop();

  // Routing for one request; exposed so the page contents can be checked
  // without a socket.
  Reply handle(http::verb method, std::string_view target);

private:
  class Session;

  RedirectListener(ListenConfig listen, std::shared_ptr<AuthSession> session);

  monad::MyVoidResult start_listening();
  void start_thread();
  void do_accept();
  void close_acceptor();
  Reply handle_token_received(std::string_view target);

  ListenConfig listen_;
  std::shared_ptr<AuthSession> session_;

  net::io_context ioc_;
  tcp::acceptor acceptor_;
  std::unique_ptr<net::executor_work_guard<net::io_context::executor_type>>
      work_guard_;
  std::thread thread_;

  std::atomic<std::uint16_t> actual_port_{0};
  std::atomic<bool> stopped_{false};

  std::weak_ptr<RedirectListener> weak_self_;

  src::severity_logger<trivial::severity_level> lg_;
};

} // namespace fitbridge::oauth
