#include "tcx/tcx_transformer.hpp"

#include <fmt/format.h>

#include <sstream>

#include "my_error_codes.hpp"
#include "tcx/timestamp.hpp"
#include "util/my_logging.hpp"

namespace fitbridge::tcx {

namespace {

template <class... Ts> struct overloaded : Ts... {
  using Ts::operator()...;
};
template <class... Ts> overloaded(Ts...) -> overloaded<Ts...>;

monad::MyVoidResult missing(const std::string &what) {
  return monad::MyVoidResult::Err(
      monad::make_error(my_errors::TCX::MISSING_ELEMENT, what + " not found"));
}

// Shortest round-trip text: 60000 ms -> "60", 1500 ms -> "1.5".
std::string format_number(double value) { return fmt::format("{}", value); }

void append_text(pugi::xml_node parent, const char *name,
                 const std::string &value) {
  parent.append_child(name).text().set(value.c_str());
}

pugi::xml_node find_activity(pugi::xml_document &doc) {
  return doc.child("TrainingCenterDatabase")
      .child("Activities")
      .child("Activity");
}

// Device_t lists Name before UnitId and ProductID.
monad::MyVoidResult add_device_name(pugi::xml_node activity) {
  auto creator = activity.child("Creator");
  if (!creator) {
    return missing("Activity/Creator");
  }
  creator.prepend_child("Name").text().set(kDeviceName);
  return monad::MyVoidResult::Ok();
}

void append_trackpoint(pugi::xml_node track, const std::string &time,
                       const std::string &distance) {
  auto point = track.append_child("Trackpoint");
  append_text(point, "Time", time);
  append_text(point, "DistanceMeters", distance);
}

monad::MyVoidResult patch_swim(pugi::xml_document &doc,
                               const ActivitySummary &summary) {
  auto activity = find_activity(doc);
  if (!activity) {
    return missing("TrainingCenterDatabase/Activities/Activity");
  }

  auto sport = activity.attribute("Sport");
  if (!sport) {
    sport = activity.append_attribute("Sport");
  }
  sport.set_value("Swim");

  auto id = activity.child("Id");
  auto start = parse_rfc3339(id.text().get());
  if (start.is_err()) {
    return monad::MyVoidResult::Err(std::move(start).error());
  }

  auto named = add_device_name(activity);
  if (named.is_err()) {
    return named;
  }

  const std::string start_time = format_utc_seconds(start.value());
  const std::string end_time =
      format_utc_seconds(start.value() + summary.duration);

  // Activity_t: Id, Lap+, Notes, Training, Creator. The new lap goes after
  // the id and any laps already present.
  pugi::xml_node anchor = id;
  for (auto existing : activity.children("Lap")) {
    anchor = existing;
  }
  auto lap = anchor ? activity.insert_child_after("Lap", anchor)
                    : activity.prepend_child("Lap");
  lap.append_attribute("StartTime").set_value(start_time.c_str());

  const std::string distance = format_number(summary.distance_meters);
  append_text(lap, "TotalTimeSeconds",
              format_number(static_cast<double>(summary.duration.count()) /
                            1000.0));
  append_text(lap, "DistanceMeters", distance);
  append_text(lap, "Calories", std::to_string(summary.calories));
  append_text(lap, "Intensity", "Active");
  append_text(lap, "TriggerMethod", "Manual");

  auto track = lap.append_child("Track");
  append_trackpoint(track, start_time, "0");
  append_trackpoint(track, end_time, distance);
  return monad::MyVoidResult::Ok();
}

monad::MyVoidResult patch_device_name(pugi::xml_document &doc) {
  auto activity = find_activity(doc);
  if (!activity) {
    return missing("TrainingCenterDatabase/Activities/Activity");
  }
  return add_device_name(activity);
}

} // namespace

ActivityCategory classify_category(std::string_view label) {
  if (label == "Swim") {
    return SwimCategory{};
  }
  if (label == "Treadmill" || label == "Weights") {
    return DeviceNameCategory{std::string(label)};
  }
  return PassThroughCategory{std::string(label)};
}

std::string category_label(const ActivityCategory &category) {
  return std::visit(
      overloaded{[](const SwimCategory &) { return std::string("Swim"); },
                 [](const DeviceNameCategory &c) { return c.label; },
                 [](const PassThroughCategory &c) { return c.label; }},
      category);
}

monad::MyVoidResult patch_document(pugi::xml_document &doc,
                                   const ActivitySummary &summary) {
  src::severity_logger<trivial::severity_level> lg;
  const auto category = classify_category(summary.category);
  return std::visit(
      overloaded{
          [&](const SwimCategory &) {
            BOOST_LOG_SEV(lg, trivial::info)
                << "Synthesising lap and track for Swim activity";
            return patch_swim(doc, summary);
          },
          [&](const DeviceNameCategory &c) {
            BOOST_LOG_SEV(lg, trivial::info)
                << "Adding device name for " << c.label << " activity";
            return patch_device_name(doc);
          },
          [&](const PassThroughCategory &c) {
            BOOST_LOG_SEV(lg, trivial::info)
                << "No changes needed for '" << c.label << "' activity";
            return monad::MyVoidResult::Ok();
          }},
      category);
}

monad::MyVoidResult load_document(pugi::xml_document &doc,
                                  std::string_view xml) {
  auto result = doc.load_buffer(xml.data(), xml.size(),
                                pugi::parse_default | pugi::parse_declaration);
  if (!result) {
    return monad::MyVoidResult::Err(monad::make_error(
        my_errors::TCX::PARSE_FAILED,
        fmt::format("TCX document is not well-formed at offset {}: {}",
                    result.offset, result.description())));
  }
  return monad::MyVoidResult::Ok();
}

monad::MyResult<std::string>
serialize_document(const pugi::xml_document &doc) {
  std::ostringstream os;
  doc.save(os, "  ", pugi::format_indent, pugi::encoding_utf8);
  if (!os) {
    return monad::MyResult<std::string>::Err(monad::make_error(
        my_errors::TCX::SERIALIZE_FAILED, "Failed to serialize TCX document"));
  }
  return monad::MyResult<std::string>::Ok(os.str());
}

monad::MyResult<std::string> transform_document(pugi::xml_document &doc,
                                                const ActivitySummary &summary) {
  auto patched = patch_document(doc, summary);
  if (patched.is_err()) {
    return monad::MyResult<std::string>::Err(std::move(patched).error());
  }
  return serialize_document(doc);
}

} // namespace fitbridge::tcx
