#pragma once

#include <tilefuse/core/crop.hpp>
#include <tilefuse/core/detection.hpp>
#include <tilefuse/core/error.hpp>
#include <tilefuse/core/fused_result.hpp>
#include <tilefuse/core/nms.hpp>
#include <expected>
#include <span>
#include <string>
#include <unordered_map>

namespace tilefuse::core {

/// Maps model class id to a display name.
using ClassNameTable = std::unordered_map<ClassId, std::string>;

/// Settings for merging per-crop detections.
struct FusionConfig {
  MatchMetric match_metric{MatchMetric::IOS};
  float nms_threshold{0.3f};
  bool intelligent_sorter{true};
};

/// Concatenates every crop's remapped detections, in tile order.
///
/// If any crop carries masks, the result's masks list is co-indexed with the
/// boxes and instances from crops without masks get an empty mask.
[[nodiscard]] Detections aggregate(std::span<const Crop> crops);

/// Name for \p id, or "class_<id>" when the table has no entry.
[[nodiscard]] std::string class_name(const ClassNameTable& names, ClassId id);

/// aggregate() + suppress() + selection of the surviving instances.
/// Masks are copied to the result only when \p keep_masks is set.
/// Image/canvas sizes and run diagnostics are left for the caller to fill.
[[nodiscard]] std::expected<FusedResult, PipelineError> fuse(std::span<const Crop> crops,
                                                             const ClassNameTable& names,
                                                             const FusionConfig& config,
                                                             bool keep_masks);

}  // namespace tilefuse::core
