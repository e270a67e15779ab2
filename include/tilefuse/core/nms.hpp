#pragma once

#include <tilefuse/core/error.hpp>
#include <tilefuse/core/geometry.hpp>
#include <tilefuse/core/mask.hpp>
#include <cstddef>
#include <cstdint>
#include <expected>
#include <span>
#include <string_view>
#include <vector>

namespace tilefuse::core {

/// Overlap metric used to decide whether two detections are duplicates.
enum class MatchMetric : std::uint8_t {
  IOU,  // intersection over union
  IOS,  // intersection over the smaller of the two areas
};

/// Accepts "IOU" / "IOS" in any letter case.
[[nodiscard]] std::expected<MatchMetric, PipelineError> parse_match_metric(std::string_view name);
[[nodiscard]] std::string_view to_string(MatchMetric metric) noexcept;

/// Box overlap under \p metric; 0 when the denominator is not positive.
[[nodiscard]] double box_match_value(const BBox& a, const BBox& b, MatchMetric metric) noexcept;

/// Pixel overlap of two binary masks under \p metric; 0 when the denominator is zero.
[[nodiscard]] double mask_match_value(const BinaryMask& a,
                                      const BinaryMask& b,
                                      MatchMetric metric) noexcept;

/// Initial NMS order, ascending priority: the last index is processed first.
/// Plain mode sorts by confidence. The intelligent sorter sorts by
/// (confidence rounded to one decimal, box area), so inside one confidence
/// bucket the larger box wins. Equal keys keep their input order.
[[nodiscard]] std::vector<std::size_t> priority_order(std::span<const float> confidences,
                                                      std::span<const BBox> boxes,
                                                      bool intelligent_sorter);

/// Greedy non-maximum suppression over co-indexed confidences/boxes/masks.
///
/// Returns surviving indices in the order they were accepted.
///
/// Without masks, every remaining box whose box metric against the accepted
/// box is above \p threshold is suppressed. With masks, boxes that do not
/// overlap the accepted box are left alone, and overlapping ones are
/// suppressed only if their mask metric is above \p threshold. An empty
/// mask stands for "no mask" and falls back to the box metric for that pair.
/// A metric equal to the threshold never suppresses.
///
/// Errors: InvalidConfig for list length mismatches or an unknown metric.
[[nodiscard]] std::expected<std::vector<std::size_t>, PipelineError> suppress(
    std::span<const float> confidences,
    std::span<const BBox> boxes,
    MatchMetric metric,
    float threshold,
    std::span<const BinaryMask> masks = {},
    bool intelligent_sorter = false);

}  // namespace tilefuse::core
