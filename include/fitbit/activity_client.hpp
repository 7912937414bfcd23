#pragma once

#include <cstdint>
#include <string>

#include "data/activity.hpp"
#include "fitbit/https_client.hpp"
#include "result_monad.hpp"
#include "util/my_logging.hpp"

namespace fitbridge::fitbit {

inline constexpr const char *kFitbitApiBase = "https://api.fitbit.com";

class IActivityFetcher {
public:
  virtual ~IActivityFetcher() = default;

  // Activities logged on `date` (YYYY-MM-DD).
  virtual monad::MyResult<data::DailyActivities>
  fetch_activities(const std::string &access_token,
                   const std::string &date) = 0;

  // Raw TCX export of one activity, including partial exports.
  virtual monad::MyResult<std::string>
  fetch_tcx(const std::string &access_token, std::int64_t log_id) = 0;
};

class FitbitActivityClient : public IActivityFetcher {
public:
  explicit FitbitActivityClient(std::string api_base)
      : api_base_(std::move(api_base)) {}

  monad::MyResult<data::DailyActivities>
  fetch_activities(const std::string &access_token,
                   const std::string &date) override;

  monad::MyResult<std::string> fetch_tcx(const std::string &access_token,
                                         std::int64_t log_id) override;

  std::string activities_url(const std::string &date) const;
  std::string tcx_url(std::int64_t log_id) const;

private:
  monad::MyResult<HttpResponse> authorized_get(const std::string &url,
                                               const std::string &token);

  std::string api_base_;
  HttpsClient http_;
  src::severity_logger<trivial::severity_level> lg_;
};

} // namespace fitbridge::fitbit
