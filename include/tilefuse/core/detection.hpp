#pragma once

#include <tilefuse/core/geometry.hpp>
#include <tilefuse/core/mask.hpp>
#include <cstddef>
#include <cstdint>
#include <vector>

namespace tilefuse::core {

using ClassId = std::int64_t;

/// Detections of one image region as co-indexed lists: index i across
/// boxes, classes, confidences (and masks, when segmenting) is one instance.
struct Detections {
  std::vector<BBox> boxes;
  std::vector<ClassId> classes;
  std::vector<float> confidences;
  std::vector<BinaryMask> masks;  // empty when segmentation is disabled

  [[nodiscard]] std::size_t size() const noexcept { return boxes.size(); }
  [[nodiscard]] bool empty() const noexcept { return boxes.empty(); }
  [[nodiscard]] bool has_masks() const noexcept { return !masks.empty(); }

  /// All lists have equal length; masks may also be absent.
  [[nodiscard]] bool is_consistent() const noexcept {
    const std::size_t n = boxes.size();
    return classes.size() == n && confidences.size() == n &&
           (masks.empty() || masks.size() == n);
  }

  void add(const BBox& box, ClassId cls, float confidence) {
    boxes.push_back(box);
    classes.push_back(cls);
    confidences.push_back(confidence);
  }
  void add(const BBox& box, ClassId cls, float confidence, BinaryMask mask) {
    add(box, cls, confidence);
    masks.push_back(std::move(mask));
  }
};

}  // namespace tilefuse::core
