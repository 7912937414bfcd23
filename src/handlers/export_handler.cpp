#include "handlers/export_handler.hpp"

#include <chrono>

#include <pugixml.hpp>

#include "tcx/tcx_transformer.hpp"

namespace fitbridge {

monad::MyVoidResult ExportHandler::start() {
  const std::string date = cli_ctx_.params.activity_date;
  output_.info() << "Exporting an activity from " << date << std::endl;
  return controller_.run([this, date](const std::string &token) {
    return export_activity(token, date);
  });
}

monad::MyVoidResult
ExportHandler::export_activity(const std::string &access_token,
                               const std::string &date) {
  output_.info() << "Fetching activity data..." << std::endl;
  auto daily = fetcher_.fetch_activities(access_token, date);
  if (daily.is_err()) {
    return monad::MyVoidResult::Err(std::move(daily).error());
  }

  auto chosen = selector_.select(daily.value().activities);
  if (chosen.is_err()) {
    return monad::MyVoidResult::Err(std::move(chosen).error());
  }
  const data::Activity &activity = chosen.value();

  auto raw = fetcher_.fetch_tcx(access_token, activity.log_id);
  if (raw.is_err()) {
    return monad::MyVoidResult::Err(std::move(raw).error());
  }

  pugi::xml_document doc;
  if (auto loaded = tcx::load_document(doc, raw.value()); loaded.is_err()) {
    return loaded;
  }

  tcx::ActivitySummary summary{
      .category = activity.activity_parent_name,
      .duration = std::chrono::milliseconds(activity.duration),
      .distance_meters = activity.distance_meters(),
      .calories = activity.calories};
  auto xml = tcx::transform_document(doc, summary);
  if (xml.is_err()) {
    return monad::MyVoidResult::Err(std::move(xml).error());
  }

  auto written = writer_.write(activity.export_filename(), xml.value());
  if (written.is_err()) {
    return monad::MyVoidResult::Err(std::move(written).error());
  }
  BOOST_LOG_SEV(lg_, trivial::info)
      << "Exported activity " << activity.log_id << " ("
      << activity.activity_parent_name << ") to "
      << written.value().string();
  output_.success() << "Data saved to " << written.value().string()
                    << std::endl;
  return monad::MyVoidResult::Ok();
}

monad::MyVoidResult AuthorizeHandler::start() {
  return controller_.run([this](const std::string &) {
    output_.success() << "Authorization succeeded." << std::endl;
    return monad::MyVoidResult::Ok();
  });
}

} // namespace fitbridge
