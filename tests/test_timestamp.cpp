#include <gtest/gtest.h>

#include <chrono>
#include <string>

#include "my_error_codes.hpp"
#include "tcx/timestamp.hpp"

namespace {

using fitbridge::tcx::convert_timestamp;
using fitbridge::tcx::format_utc_seconds;
using fitbridge::tcx::parse_rfc3339;
using namespace std::chrono_literals;

TEST(Timestamp, AddsPositiveOffset) {
  auto r = convert_timestamp("2024-01-01T10:00:00Z", 30s);
  ASSERT_TRUE(r.is_ok()) << r.error().what;
  EXPECT_EQ(r.value(), "2024-01-01T10:00:30Z");
}

TEST(Timestamp, SubtractsNegativeOffset) {
  auto r = convert_timestamp("2024-01-01T10:00:00Z", -30s);
  ASSERT_TRUE(r.is_ok()) << r.error().what;
  EXPECT_EQ(r.value(), "2024-01-01T09:59:30Z");
}

TEST(Timestamp, ZeroOffsetNormalisesToUtc) {
  auto r = convert_timestamp("2024-01-01T10:00:00Z", 0ms);
  ASSERT_TRUE(r.is_ok()) << r.error().what;
  EXPECT_EQ(r.value(), "2024-01-01T10:00:00Z");
}

TEST(Timestamp, NumericZoneIsConvertedToUtc) {
  auto r = convert_timestamp("2024-01-01T12:00:00+02:00", 0ms);
  ASSERT_TRUE(r.is_ok()) << r.error().what;
  EXPECT_EQ(r.value(), "2024-01-01T10:00:00Z");

  auto west = convert_timestamp("2023-12-31T22:30:00-05:00", 0ms);
  ASSERT_TRUE(west.is_ok()) << west.error().what;
  EXPECT_EQ(west.value(), "2024-01-01T03:30:00Z");
}

TEST(Timestamp, FractionalSecondsAreTruncated) {
  auto r = convert_timestamp("2024-05-01T07:30:00.750+02:00", 500ms);
  ASSERT_TRUE(r.is_ok()) << r.error().what;
  EXPECT_EQ(r.value(), "2024-05-01T05:30:01Z");
}

TEST(Timestamp, OffsetCrossesMidnight) {
  auto r = convert_timestamp("2024-02-28T23:59:00Z", 120000ms);
  ASSERT_TRUE(r.is_ok()) << r.error().what;
  EXPECT_EQ(r.value(), "2024-02-29T00:01:00Z");
}

TEST(Timestamp, EmptyInputIsParseError) {
  auto r = convert_timestamp("", 30s);
  ASSERT_TRUE(r.is_err());
  EXPECT_EQ(r.error().code, my_errors::TCX::TIMESTAMP_PARSE_ERROR);
}

TEST(Timestamp, LayoutStringIsParseError) {
  auto r = convert_timestamp("2006-01-02T15:04:05Z07:00", 30s);
  ASSERT_TRUE(r.is_err());
  EXPECT_EQ(r.error().code, my_errors::TCX::TIMESTAMP_PARSE_ERROR);
}

TEST(Timestamp, RejectsMissingZone) {
  EXPECT_TRUE(parse_rfc3339("2024-01-01T10:00:00").is_err());
  EXPECT_TRUE(parse_rfc3339("2024-01-01 10:00:00Z").is_err());
  EXPECT_TRUE(parse_rfc3339("not a timestamp").is_err());
}

TEST(Timestamp, FormatsWholeSeconds) {
  auto tp = parse_rfc3339("2024-05-01T05:30:00.999Z");
  ASSERT_TRUE(tp.is_ok()) << tp.error().what;
  EXPECT_EQ(format_utc_seconds(tp.value()), "2024-05-01T05:30:00Z");
}

} // namespace
