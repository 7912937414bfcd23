#pragma once

#include <cstdint>
#include <functional>
#include <map>
#include <string>
#include <vector>

#include "conf/credentials_config.hpp"
#include "fitbit/activity_client.hpp"
#include "handlers/activity_selector.hpp"
#include "my_error_codes.hpp"
#include "util/browser_launcher.hpp"
#include "util/document_writer.hpp"

namespace testinfra {

inline fitbridge::Credentials make_credentials() {
  fitbridge::Credentials c{};
  c.client_id = "23ABCD";
  c.client_secret = "unused";
  c.redirect_url = "http://localhost:8080/callback";
  return c;
}

class FakeCredentialsProvider : public fitbridge::ICredentialsProvider {
public:
  explicit FakeCredentialsProvider(fitbridge::Credentials credentials)
      : credentials_(std::move(credentials)) {}

  monad::MyResult<fitbridge::Credentials> load() override {
    ++loads;
    return monad::MyResult<fitbridge::Credentials>::Ok(credentials_);
  }

  int loads{0};

private:
  fitbridge::Credentials credentials_;
};

// Stands in for the desktop browser: records the URL and runs `on_open`,
// which usually plays the part of the authorization server.
class FakeBrowser : public fitbridge::IBrowserLauncher {
public:
  std::function<monad::MyVoidResult(const std::string &url)> on_open;
  std::vector<std::string> opened;

  monad::MyVoidResult open(const std::string &url) override {
    opened.push_back(url);
    if (on_open) {
      return on_open(url);
    }
    return monad::MyVoidResult::Ok();
  }
};

class FakeFetcher : public fitbridge::fitbit::IActivityFetcher {
public:
  fitbridge::data::DailyActivities daily;
  std::map<std::int64_t, std::string> tcx_by_log_id;
  std::vector<std::string> tokens_seen;

  monad::MyResult<fitbridge::data::DailyActivities>
  fetch_activities(const std::string &access_token,
                   const std::string &) override {
    tokens_seen.push_back(access_token);
    return monad::MyResult<fitbridge::data::DailyActivities>::Ok(daily);
  }

  monad::MyResult<std::string> fetch_tcx(const std::string &access_token,
                                         std::int64_t log_id) override {
    tokens_seen.push_back(access_token);
    auto it = tcx_by_log_id.find(log_id);
    if (it == tcx_by_log_id.end()) {
      return monad::MyResult<std::string>::Err(monad::make_error(
          my_errors::NETWORK::HTTP_STATUS, "HTTP 404 from fake"));
    }
    return monad::MyResult<std::string>::Ok(it->second);
  }
};

class PickFirstSelector : public fitbridge::IActivitySelector {
public:
  monad::MyResult<fitbridge::data::Activity>
  select(const std::vector<fitbridge::data::Activity> &activities) override {
    if (activities.empty()) {
      return monad::MyResult<fitbridge::data::Activity>::Err(monad::make_error(
          my_errors::GENERAL::NOT_FOUND, "nothing to select"));
    }
    return monad::MyResult<fitbridge::data::Activity>::Ok(activities.front());
  }
};

class MemoryWriter : public fitbridge::IDocumentWriter {
public:
  std::map<std::string, std::string> files;

  monad::MyResult<std::filesystem::path>
  write(const std::string &filename, const std::string &content) override {
    files[filename] = content;
    return monad::MyResult<std::filesystem::path>::Ok(
        std::filesystem::path("memory") / filename);
  }
};

} // namespace testinfra
