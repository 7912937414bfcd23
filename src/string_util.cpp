#include "util/string_util.hpp"

#include <date/date.h>

#include <boost/url/encode.hpp>
#include <boost/url/rfc/unreserved_chars.hpp>

#include <cctype>
#include <regex>
#include <sstream>

namespace fitbridge {
namespace stringutil {

std::string trim(std::string_view str) {
  std::size_t first = 0;
  while (first < str.size() &&
         std::isspace(static_cast<unsigned char>(str[first]))) {
    ++first;
  }
  std::size_t last = str.size();
  while (last > first &&
         std::isspace(static_cast<unsigned char>(str[last - 1]))) {
    --last;
  }
  return std::string(str.substr(first, last - first));
}

std::string join(const std::vector<std::string> &parts, std::string_view sep) {
  std::string out;
  for (std::size_t i = 0; i < parts.size(); ++i) {
    if (i) {
      out.append(sep);
    }
    out.append(parts[i]);
  }
  return out;
}

std::string url_encode(std::string_view value) {
  return boost::urls::encode(value, boost::urls::unreserved_chars);
}

bool is_calendar_date(std::string_view value) {
  static const std::regex kShape(R"(^\d{4}-\d{2}-\d{2}$)");
  const std::string s(value);
  if (!std::regex_match(s, kShape)) {
    return false;
  }
  std::istringstream in(s);
  date::year_month_day ymd{};
  in >> date::parse("%F", ymd);
  return !in.fail() && ymd.ok();
}

std::string redact(std::string_view secret, std::size_t keep) {
  if (secret.size() <= keep) {
    return std::string(secret.size(), '*');
  }
  return std::string(secret.substr(0, keep)) + "...";
}

} // namespace stringutil
} // namespace fitbridge
