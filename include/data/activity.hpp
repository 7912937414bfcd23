#pragma once

#include <boost/json.hpp>
#include <cstdint>
#include <stdexcept>
#include <string>
#include <vector>

namespace fitbridge::data {

// One entry of GET /1/user/-/activities/date/<date>.json. Distance is in
// kilometres, duration in milliseconds.
struct Activity {
  std::int64_t log_id{0};
  std::int64_t activity_id{0};
  std::string activity_parent_name;
  std::string name;
  std::string description;
  std::int64_t calories{0};
  double distance{0};
  std::int64_t duration{0};
  std::int64_t steps{0};
  std::string start_date;
  std::string start_time;
  bool has_start_time{false};

  double distance_meters() const { return distance * 1000.0; }

  // <category>-<logId>.tcx. The category comes from the API, so path
  // separators and control characters are replaced to keep the name a
  // single path component.
  std::string export_filename() const {
    std::string category = activity_parent_name;
    for (auto &c : category) {
      if (c == '/' || c == '\\' || c == ':' ||
          static_cast<unsigned char>(c) < 0x20) {
        c = '_';
      }
    }
    if (category.empty()) {
      category = "activity";
    }
    return category + "-" + std::to_string(log_id) + ".tcx";
  }
};

struct DailyActivities {
  std::vector<Activity> activities;
};

inline Activity tag_invoke(const boost::json::value_to_tag<Activity> &,
                           const boost::json::value &jv) {
  using namespace boost::json;

  if (!jv.is_object()) {
    throw std::runtime_error("Activity expects JSON object");
  }
  const auto &obj = jv.as_object();
  Activity a{};

  if (auto *p = obj.if_contains("logId")) {
    a.log_id = value_to<std::int64_t>(*p);
  } else {
    throw std::runtime_error("Activity is missing logId");
  }
  if (auto *p = obj.if_contains("activityId")) {
    a.activity_id = value_to<std::int64_t>(*p);
  }
  if (auto *p = obj.if_contains("activityParentName")) {
    a.activity_parent_name = value_to<std::string>(*p);
  }
  if (auto *p = obj.if_contains("name")) {
    a.name = value_to<std::string>(*p);
  }
  if (auto *p = obj.if_contains("description")) {
    a.description = value_to<std::string>(*p);
  }
  if (auto *p = obj.if_contains("calories")) {
    a.calories = value_to<std::int64_t>(*p);
  }
  if (auto *p = obj.if_contains("distance")) {
    a.distance = value_to<double>(*p);
  }
  if (auto *p = obj.if_contains("duration")) {
    a.duration = value_to<std::int64_t>(*p);
  }
  if (auto *p = obj.if_contains("steps")) {
    a.steps = value_to<std::int64_t>(*p);
  }
  if (auto *p = obj.if_contains("startDate")) {
    a.start_date = value_to<std::string>(*p);
  }
  if (auto *p = obj.if_contains("startTime")) {
    a.start_time = value_to<std::string>(*p);
  }
  if (auto *p = obj.if_contains("hasStartTime")) {
    a.has_start_time = value_to<bool>(*p);
  }
  return a;
}

inline DailyActivities
tag_invoke(const boost::json::value_to_tag<DailyActivities> &,
           const boost::json::value &jv) {
  using namespace boost::json;

  if (!jv.is_object()) {
    throw std::runtime_error("DailyActivities expects JSON object");
  }
  DailyActivities d{};
  if (auto *p = jv.as_object().if_contains("activities")) {
    if (p->is_array()) {
      d.activities = value_to<std::vector<Activity>>(*p);
    }
  }
  return d;
}

} // namespace fitbridge::data
