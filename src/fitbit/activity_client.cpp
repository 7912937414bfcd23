#include "fitbit/activity_client.hpp"

#include <boost/json.hpp>
#include <fmt/format.h>

#include "my_error_codes.hpp"

namespace fitbridge::fitbit {

namespace json = boost::json;

std::string FitbitActivityClient::activities_url(const std::string &date) const {
  return fmt::format("{}/1/user/-/activities/date/{}.json", api_base_, date);
}

std::string FitbitActivityClient::tcx_url(std::int64_t log_id) const {
  return fmt::format("{}/1/user/-/activities/{}.tcx?includePartialTCX=true",
                     api_base_, log_id);
}

monad::MyResult<HttpResponse>
FitbitActivityClient::authorized_get(const std::string &url,
                                     const std::string &token) {
  auto res = http_.get(url, {{"Authorization", "Bearer " + token}});
  if (res.is_err()) {
    return res;
  }
  const auto &r = res.value();
  if (!r.ok()) {
    BOOST_LOG_SEV(lg_, trivial::error)
        << "GET " << url << " returned HTTP " << r.status;
    std::string detail = r.body.substr(0, 512);
    if (r.status == 401) {
      detail = "access token rejected or expired. " + detail;
    }
    return monad::MyResult<HttpResponse>::Err(monad::make_error(
        my_errors::NETWORK::HTTP_STATUS,
        fmt::format("HTTP {} from {}: {}", r.status, url, detail)));
  }
  return res;
}

monad::MyResult<data::DailyActivities>
FitbitActivityClient::fetch_activities(const std::string &access_token,
                                       const std::string &date) {
  auto res = authorized_get(activities_url(date), access_token);
  if (res.is_err()) {
    return monad::MyResult<data::DailyActivities>::Err(std::move(res).error());
  }

  boost::system::error_code ec;
  json::value jv = json::parse(res.value().body, ec);
  if (ec) {
    return monad::MyResult<data::DailyActivities>::Err(monad::make_error(
        my_errors::JSON::MALFORMED,
        "Activity list is not valid JSON: " + ec.message()));
  }
  BOOST_LOG_SEV(lg_, trivial::trace) << "Activity list: " << jv;
  try {
    auto daily = json::value_to<data::DailyActivities>(jv);
    BOOST_LOG_SEV(lg_, trivial::info)
        << "Fetched " << daily.activities.size() << " activities for " << date;
    return monad::MyResult<data::DailyActivities>::Ok(std::move(daily));
  } catch (const std::exception &ex) {
    return monad::MyResult<data::DailyActivities>::Err(monad::make_error(
        my_errors::JSON::TYPE_MISMATCH,
        std::string("Unexpected activity list shape: ") + ex.what()));
  }
}

monad::MyResult<std::string>
FitbitActivityClient::fetch_tcx(const std::string &access_token,
                                std::int64_t log_id) {
  auto res = authorized_get(tcx_url(log_id), access_token);
  if (res.is_err()) {
    return monad::MyResult<std::string>::Err(std::move(res).error());
  }
  BOOST_LOG_SEV(lg_, trivial::info) << "Fetched TCX for activity " << log_id
                                    << " (" << res.value().body.size()
                                    << " bytes)";
  return monad::MyResult<std::string>::Ok(res.value().body);
}

} // namespace fitbridge::fitbit
