#pragma once

#include <boost/json.hpp>
#include <cstdint>
#include <stdexcept>
#include <string>

namespace fitbridge {

namespace json = boost::json;

struct LoggingConfig {
  std::string level{"info"};
  std::string log_dir{"logs"};
  std::string log_file{"fit-bridge"};
  std::uint64_t rotation_size{10 * 1024 * 1024};

  friend LoggingConfig tag_invoke(const json::value_to_tag<LoggingConfig> &,
                                  const json::value &jv) {
    if (!jv.is_object()) {
      throw std::runtime_error("LoggingConfig expects JSON object");
    }
    const auto &jo = jv.as_object();
    LoggingConfig lc{};
    if (auto *p = jo.if_contains("level"))
      lc.level = json::value_to<std::string>(*p);
    if (auto *p = jo.if_contains("log_dir"))
      lc.log_dir = json::value_to<std::string>(*p);
    if (auto *p = jo.if_contains("log_file"))
      lc.log_file = json::value_to<std::string>(*p);
    if (auto *p = jo.if_contains("rotation_size"))
      lc.rotation_size = json::value_to<std::uint64_t>(*p);
    return lc;
  }
};

} // namespace fitbridge
