#include <gtest/gtest.h>

#include <pugixml.hpp>

#include <filesystem>
#include <fstream>
#include <iterator>
#include <sstream>
#include <string>

#include "fitbridge_fakes.hpp"
#include "handlers/activity_selector.hpp"
#include "handlers/export_handler.hpp"
#include "handlers/session_controller.hpp"
#include "http_test_helper.hpp"
#include "my_error_codes.hpp"
#include "tcx_samples.hpp"

namespace {

using namespace fitbridge;

data::Activity make_activity(std::int64_t log_id, const std::string &category,
                             double km, std::int64_t ms) {
  data::Activity a{};
  a.log_id = log_id;
  a.activity_parent_name = category;
  a.name = category;
  a.distance = km;
  a.duration = ms;
  a.calories = 210;
  a.start_date = "2024-05-01";
  a.start_time = "07:30";
  return a;
}

fitbridge::CliCtx make_ctx(const std::string &date) {
  CliParams params;
  params.subcmd = std::string(kExportCommand);
  params.activity_date = date;
  return fitbridge::CliCtx(po::variables_map{}, {}, std::move(params));
}

class ExportHandlerTest : public ::testing::Test {
protected:
  ExportHandlerTest()
      : ctx_(make_ctx("2024-05-01")),
        credentials_(testinfra::make_credentials()), output_(5, out_, err_),
        controller_(credentials_, browser_, output_),
        handler_(ctx_, output_, controller_, fetcher_, selector_, writer_) {
    SessionOptions options{};
    options.listen = {"127.0.0.1", 0};
    controller_.set_options(options);

    fetcher_.daily.activities.push_back(
        make_activity(61234567890, "Swim", 0.75, 1800000));
    fetcher_.tcx_by_log_id[61234567890] = testinfra::kSwimTcx;
  }

  std::ostringstream out_;
  std::ostringstream err_;
  fitbridge::CliCtx ctx_;
  testinfra::FakeCredentialsProvider credentials_;
  testinfra::FakeBrowser browser_;
  customio::ConsoleOutput output_;
  SessionController controller_;
  testinfra::FakeFetcher fetcher_;
  testinfra::PickFirstSelector selector_;
  testinfra::MemoryWriter writer_;
  ExportHandler handler_;
};

TEST_F(ExportHandlerTest, WritesPatchedSwimExport) {
  auto r = handler_.export_activity("tok", "2024-05-01");
  ASSERT_TRUE(r.is_ok()) << r.error().what;

  ASSERT_EQ(writer_.files.count("Swim-61234567890.tcx"), 1u);
  pugi::xml_document doc;
  ASSERT_TRUE(doc.load_string(writer_.files["Swim-61234567890.tcx"].c_str()));
  auto lap = doc.child("TrainingCenterDatabase")
                 .child("Activities")
                 .child("Activity")
                 .child("Lap");
  ASSERT_TRUE(lap);
  EXPECT_STREQ(lap.child("DistanceMeters").text().get(), "750");
  EXPECT_STREQ(lap.child("TotalTimeSeconds").text().get(), "1800");
  EXPECT_NE(err_.str().find("Data saved to"), std::string::npos);
}

TEST_F(ExportHandlerTest, StartRunsHandshakeThenExports) {
  browser_.on_open = [this](const std::string &url) {
    const std::string state = url.substr(url.rfind("&state=") + 7);
    testinfra::http_get("127.0.0.1", controller_.listener_port(),
                        "/token-received?token=live-token&state=" + state);
    return monad::MyVoidResult::Ok();
  };

  auto r = handler_.start();
  ASSERT_TRUE(r.is_ok()) << r.error().what;
  ASSERT_EQ(fetcher_.tokens_seen.size(), 2u);
  EXPECT_EQ(fetcher_.tokens_seen[0], "live-token");
  EXPECT_EQ(fetcher_.tokens_seen[1], "live-token");
  EXPECT_EQ(writer_.files.size(), 1u);
  EXPECT_EQ(controller_.listener_port(), 0);
}

TEST_F(ExportHandlerTest, NoActivitiesIsNotFound) {
  fetcher_.daily.activities.clear();
  auto r = handler_.export_activity("tok", "2024-05-01");
  ASSERT_TRUE(r.is_err());
  EXPECT_EQ(r.error().code, my_errors::GENERAL::NOT_FOUND);
  EXPECT_TRUE(writer_.files.empty());
}

TEST_F(ExportHandlerTest, TcxFetchFailureWritesNothing) {
  fetcher_.tcx_by_log_id.clear();
  auto r = handler_.export_activity("tok", "2024-05-01");
  ASSERT_TRUE(r.is_err());
  EXPECT_EQ(r.error().code, my_errors::NETWORK::HTTP_STATUS);
  EXPECT_TRUE(writer_.files.empty());
}

TEST_F(ExportHandlerTest, MalformedTcxIsParseError) {
  fetcher_.tcx_by_log_id[61234567890] = "<TrainingCenterDatabase>";
  auto r = handler_.export_activity("tok", "2024-05-01");
  ASSERT_TRUE(r.is_err());
  EXPECT_EQ(r.error().code, my_errors::TCX::PARSE_FAILED);
}

TEST_F(ExportHandlerTest, PassThroughCategoryIsWrittenUnpatched) {
  fetcher_.daily.activities = {make_activity(5, "Run", 5.0, 1800000)};
  fetcher_.tcx_by_log_id[5] = testinfra::kTreadmillTcx;
  auto r = handler_.export_activity("tok", "2024-05-01");
  ASSERT_TRUE(r.is_ok()) << r.error().what;
  ASSERT_EQ(writer_.files.count("Run-5.tcx"), 1u);
  EXPECT_EQ(writer_.files["Run-5.tcx"].find("<Name>Fitbit</Name>"),
            std::string::npos);
}

TEST_F(ExportHandlerTest, HostileCategoryCannotEscapeOutputDirectory) {
  fetcher_.daily.activities = {make_activity(9, "../../tmp/x", 1.0, 60000)};
  fetcher_.tcx_by_log_id[9] = testinfra::kTreadmillTcx;
  auto r = handler_.export_activity("tok", "2024-05-01");
  ASSERT_TRUE(r.is_ok()) << r.error().what;
  ASSERT_EQ(writer_.files.size(), 1u);
  EXPECT_EQ(writer_.files.begin()->first, ".._.._tmp_x-9.tcx");
}

class ConsoleSelectorTest : public ::testing::Test {
protected:
  std::ostringstream out_;
  std::ostringstream err_;
  customio::ConsoleOutput output_{3, out_, err_};
  std::vector<data::Activity> activities_{
      make_activity(1, "Swim", 0.75, 1800000),
      make_activity(2, "Treadmill", 5.0, 1800000)};
};

TEST_F(ConsoleSelectorTest, ListsActivitiesAndReturnsChoice) {
  std::istringstream in("2\n");
  ConsoleActivitySelector selector(output_, in);

  auto r = selector.select(activities_);
  ASSERT_TRUE(r.is_ok()) << r.error().what;
  EXPECT_EQ(r.value().log_id, 2);

  const std::string listing = out_.str();
  EXPECT_NE(listing.find("Available Activities:"), std::string::npos);
  EXPECT_NE(listing.find("ID: 1\n"), std::string::npos);
  EXPECT_NE(listing.find("ID: 2\n"), std::string::npos);
  EXPECT_NE(listing.find("Distance: 0.75"), std::string::npos);
  EXPECT_NE(listing.find("Distance: 5.00"), std::string::npos);
  EXPECT_NE(listing.find("Start date: 2024-05-01 07:30"), std::string::npos);
  EXPECT_NE(listing.find("You selected: 2 Treadmill"), std::string::npos);
}

TEST_F(ConsoleSelectorTest, AcceptsSurroundingWhitespace) {
  std::istringstream in("  1 \n");
  ConsoleActivitySelector selector(output_, in);
  auto r = selector.select(activities_);
  ASSERT_TRUE(r.is_ok()) << r.error().what;
  EXPECT_EQ(r.value().log_id, 1);
}

TEST_F(ConsoleSelectorTest, RejectsOutOfRangeAndGarbage) {
  for (const char *input : {"0\n", "3\n", "abc\n", "1x\n", "\n"}) {
    std::istringstream in(input);
    ConsoleActivitySelector selector(output_, in);
    auto r = selector.select(activities_);
    ASSERT_TRUE(r.is_err()) << input;
    EXPECT_EQ(r.error().code, my_errors::GENERAL::INVALID_ARGUMENT) << input;
  }
}

TEST_F(ConsoleSelectorTest, EndOfInputIsAnError) {
  std::istringstream in("");
  ConsoleActivitySelector selector(output_, in);
  auto r = selector.select(activities_);
  ASSERT_TRUE(r.is_err());
  EXPECT_EQ(r.error().code, my_errors::GENERAL::INVALID_ARGUMENT);
}

TEST_F(ConsoleSelectorTest, EmptyListIsNotFound) {
  std::istringstream in("1\n");
  ConsoleActivitySelector selector(output_, in);
  auto r = selector.select({});
  ASSERT_TRUE(r.is_err());
  EXPECT_EQ(r.error().code, my_errors::GENERAL::NOT_FOUND);
}

TEST(FileDocumentWriter, CreatesDirectoryAndReplacesContent) {
  const auto dir = std::filesystem::temp_directory_path() /
                   "fitbridge-writer-test" / "nested";
  std::error_code ec;
  std::filesystem::remove_all(dir.parent_path(), ec);

  FileDocumentWriter writer(dir);
  auto first = writer.write("Swim-1.tcx", "<first/>");
  ASSERT_TRUE(first.is_ok()) << first.error().what;
  EXPECT_EQ(first.value(), dir / "Swim-1.tcx");

  auto second = writer.write("Swim-1.tcx", "<b/>");
  ASSERT_TRUE(second.is_ok()) << second.error().what;

  std::ifstream in(second.value());
  std::string content((std::istreambuf_iterator<char>(in)),
                      std::istreambuf_iterator<char>());
  EXPECT_EQ(content, "<b/>");

  std::filesystem::remove_all(dir.parent_path(), ec);
}

TEST(FileDocumentWriter, RejectsNamesOutsideBaseDirectory) {
  const auto dir =
      std::filesystem::temp_directory_path() / "fitbridge-writer-reject";
  FileDocumentWriter writer(dir);
  for (const char *name : {"../escape.tcx", "sub/inner.tcx", "/abs.tcx", "..",
                           ""}) {
    auto r = writer.write(name, "<x/>");
    ASSERT_TRUE(r.is_err()) << name;
    EXPECT_EQ(r.error().code, my_errors::GENERAL::INVALID_ARGUMENT) << name;
  }
  EXPECT_FALSE(std::filesystem::exists(dir.parent_path() / "escape.tcx"));
}

} // namespace
