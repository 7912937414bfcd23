#pragma once

#include <boost/json.hpp>

#include <filesystem>
#include <optional>
#include <stdexcept>
#include <string>
#include <vector>

#include "customio/console_output.hpp"
#include "fitbridge_common.hpp"
#include "result_monad.hpp"
#include "util/my_logging.hpp"

namespace fitbridge {

namespace fs = std::filesystem;
namespace json = boost::json;

inline const std::vector<std::string> kDefaultScopes{"activity", "heartrate",
                                                     "location", "profile"};

inline constexpr const char *kFitbitAuthorizeEndpoint =
    "https://www.fitbit.com/oauth2/authorize";

// Registered application settings, read from credentials.json:
//   {"clientID": "...", "clientSecret": "...", "redirectUrl": "..."}
// clientSecret is accepted but unused by the implicit grant.
struct Credentials {
  std::string client_id;
  std::string client_secret;
  std::string redirect_url;
  std::vector<std::string> scopes{kDefaultScopes};
  std::string authorize_endpoint{kFitbitAuthorizeEndpoint};

  // Both the client id and the redirect URL are needed before any network
  // activity starts.
  monad::MyVoidResult validate() const;

  friend Credentials tag_invoke(const json::value_to_tag<Credentials> &,
                                const json::value &jv) {
    if (!jv.is_object()) {
      throw std::runtime_error("Credentials expects JSON object");
    }
    const auto &jo = jv.as_object();
    Credentials c{};
    if (auto *p = jo.if_contains("clientID"))
      c.client_id = json::value_to<std::string>(*p);
    if (auto *p = jo.if_contains("clientSecret"))
      c.client_secret = json::value_to<std::string>(*p);
    if (auto *p = jo.if_contains("redirectUrl"))
      c.redirect_url = json::value_to<std::string>(*p);
    if (auto *p = jo.if_contains("scopes")) {
      if (!p->is_null()) {
        c.scopes = json::value_to<std::vector<std::string>>(*p);
      }
    }
    if (auto *p = jo.if_contains("authorizeEndpoint")) {
      if (!p->is_null()) {
        c.authorize_endpoint = json::value_to<std::string>(*p);
      }
    }
    return c;
  }
};

monad::MyResult<Credentials> parse_credentials(const std::string &content);

class ICredentialsProvider {
public:
  virtual ~ICredentialsProvider() = default;

  virtual monad::MyResult<Credentials> load() = 0;
};

// Reads the file named by --credentials once and caches the result.
class CredentialsProviderFile : public ICredentialsProvider {
private:
  fs::path path_;
  std::optional<Credentials> cached_;
  src::severity_logger<trivial::severity_level> lg_;

public:
  explicit CredentialsProviderFile(fitbridge::CliCtx &cli_ctx)
      : path_(cli_ctx.params.credentials_file) {}

  monad::MyResult<Credentials> load() override;

  const fs::path &path() const { return path_; }
};

} // namespace fitbridge
