#pragma once

#include <chrono>
#include <cstdint>
#include <string>
#include <string_view>
#include <variant>

#include <pugixml.hpp>

#include "result_monad.hpp"

namespace fitbridge::tcx {

inline constexpr const char *kDeviceName = "Fitbit";

// Swim exports carry no track at all; a lap with a two-point track is
// synthesised from the activity summary.
struct SwimCategory {};

// Treadmill and Weights exports only lack the device name.
struct DeviceNameCategory {
  std::string label;
};

// Everything else is already accepted as exported.
struct PassThroughCategory {
  std::string label;
};

using ActivityCategory =
    std::variant<SwimCategory, DeviceNameCategory, PassThroughCategory>;

ActivityCategory classify_category(std::string_view label);

std::string category_label(const ActivityCategory &category);

// What the activity list knows about the activity, in the units the TCX
// schema wants.
struct ActivitySummary {
  std::string category;
  std::chrono::milliseconds duration{0};
  double distance_meters{0};
  std::int64_t calories{0};
};

/**
 * Edits `doc` in place for the summary's category. Elements are inserted in
 * the order TrainingCenterDatabase v2 requires. A failure part-way through
 * may leave earlier edits in place.
 *
 * Running the Swim edit twice adds a second lap and device name.
 */
monad::MyVoidResult patch_document(pugi::xml_document &doc,
                                   const ActivitySummary &summary);

// Pretty-prints with a two-space indent, keeping the original declaration.
monad::MyResult<std::string> serialize_document(const pugi::xml_document &doc);

// Parses `xml` into `doc`; a document that is not well-formed is
// TCX::PARSE_FAILED.
monad::MyVoidResult load_document(pugi::xml_document &doc, std::string_view xml);

// patch_document followed by serialize_document.
monad::MyResult<std::string> transform_document(pugi::xml_document &doc,
                                                const ActivitySummary &summary);

} // namespace fitbridge::tcx
