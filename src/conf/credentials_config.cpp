#include "conf/credentials_config.hpp"

#include <fstream>
#include <iterator>

#include "my_error_codes.hpp"

namespace fitbridge {

monad::MyVoidResult Credentials::validate() const {
  if (client_id.empty()) {
    return monad::MyVoidResult::Err(
        {.code = my_errors::CONFIG::MISSING_CLIENT_ID,
         .what = "The clientID and redirect URL cannot be empty."});
  }
  if (redirect_url.empty()) {
    return monad::MyVoidResult::Err(
        {.code = my_errors::CONFIG::MISSING_REDIRECT_URL,
         .what = "The clientID and redirect URL cannot be empty."});
  }
  return monad::MyVoidResult::Ok();
}

monad::MyResult<Credentials> parse_credentials(const std::string &content) {
  boost::system::error_code ec;
  json::value jv = json::parse(content, ec);
  if (ec) {
    return monad::MyResult<Credentials>::Err(
        {.code = my_errors::JSON::MALFORMED,
         .what = "credentials are not valid JSON: " + ec.message()});
  }
  try {
    return monad::MyResult<Credentials>::Ok(json::value_to<Credentials>(jv));
  } catch (const std::exception &ex) {
    return monad::MyResult<Credentials>::Err(
        {.code = my_errors::JSON::TYPE_MISMATCH,
         .what = std::string("credentials have an unexpected shape: ") +
                 ex.what()});
  }
}

monad::MyResult<Credentials> CredentialsProviderFile::load() {
  if (cached_) {
    return monad::MyResult<Credentials>::Ok(*cached_);
  }
  std::ifstream ifs(path_);
  if (!ifs) {
    return monad::MyResult<Credentials>::Err(
        {.code = my_errors::CONFIG::UNREADABLE,
         .what = "Unable to open credentials file: " + path_.string()});
  }
  std::string content((std::istreambuf_iterator<char>(ifs)),
                      std::istreambuf_iterator<char>());
  auto parsed = parse_credentials(content);
  if (parsed.is_err()) {
    auto err = std::move(parsed).error();
    err.what = path_.string() + ": " + err.what;
    return monad::MyResult<Credentials>::Err(std::move(err));
  }
  BOOST_LOG_SEV(lg_, trivial::debug)
      << "Loaded credentials from " << path_.string();
  cached_ = parsed.value();
  return monad::MyResult<Credentials>::Ok(*cached_);
}

} // namespace fitbridge
