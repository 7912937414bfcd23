#include "tcx/timestamp.hpp"

#include <regex>
#include <sstream>

#include "my_error_codes.hpp"

namespace fitbridge::tcx {

namespace {

monad::MyResult<TimePoint> parse_error(std::string_view timestamp) {
  return monad::MyResult<TimePoint>::Err(monad::make_error(
      my_errors::TCX::TIMESTAMP_PARSE_ERROR,
      "'" + std::string(timestamp) + "' is not an RFC 3339 timestamp"));
}

} // namespace

monad::MyResult<TimePoint> parse_rfc3339(std::string_view timestamp) {
  // date::parse is lenient about field widths; the shape is checked first.
  static const std::regex kShape(
      R"(^\d{4}-\d{2}-\d{2}[Tt]\d{2}:\d{2}:\d{2}(\.\d{1,9})?([Zz]|[+-]\d{2}:\d{2})$)");
  std::string text(timestamp);
  if (!std::regex_match(text, kShape)) {
    return parse_error(timestamp);
  }
  text[10] = 'T';

  TimePoint tp{};
  const char last = text.back();
  std::istringstream in;
  if (last == 'Z' || last == 'z') {
    text.pop_back();
    in.str(text);
    in >> date::parse("%FT%T", tp);
  } else {
    in.str(text);
    in >> date::parse("%FT%T%Ez", tp);
  }
  if (in.fail() || in.peek() != std::char_traits<char>::eof()) {
    return parse_error(timestamp);
  }
  return monad::MyResult<TimePoint>::Ok(tp);
}

std::string format_utc_seconds(TimePoint tp) {
  return date::format("%FT%TZ", date::floor<std::chrono::seconds>(tp));
}

monad::MyResult<std::string> convert_timestamp(std::string_view timestamp,
                                               std::chrono::milliseconds offset) {
  auto parsed = parse_rfc3339(timestamp);
  if (parsed.is_err()) {
    return monad::MyResult<std::string>::Err(std::move(parsed).error());
  }
  return monad::MyResult<std::string>::Ok(
      format_utc_seconds(parsed.value() + offset));
}

} // namespace fitbridge::tcx
