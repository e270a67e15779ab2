#include <tilefuse/vision/detection_decoder.hpp>
#include <tilefuse/core/log.hpp>
#include <tilefuse/core/nms.hpp>
#include <algorithm>
#include <cstddef>
#include <map>
#include <string>
#include <vector>

namespace tilefuse::vision {

core::Detections filter_detections(const core::Detections& detections,
                                   const InferenceParams& params) {
  core::Detections out;
  const bool copy_masks = params.segment && detections.masks.size() == detections.size();
  for (std::size_t i = 0; i < detections.size(); ++i) {
    if (detections.confidences[i] < params.confidence_threshold) continue;
    if (!params.accepts_class(detections.classes[i])) continue;
    if (copy_masks) {
      out.add(detections.boxes[i], detections.classes[i], detections.confidences[i],
              detections.masks[i]);
    } else {
      out.add(detections.boxes[i], detections.classes[i], detections.confidences[i]);
    }
  }
  return out;
}

DetectionDecoder::DetectionDecoder(InferenceParams params,
                                   std::uint32_t input_width,
                                   std::uint32_t input_height,
                                   std::uint32_t image_width,
                                   std::uint32_t image_height)
    : params_(std::move(params)),
      scale_x_(input_width > 0 ? static_cast<float>(image_width) / static_cast<float>(input_width) : 1.f),
      scale_y_(input_height > 0 ? static_cast<float>(image_height) / static_cast<float>(input_height) : 1.f),
      image_width_(static_cast<float>(image_width)),
      image_height_(static_cast<float>(image_height)) {}

core::Detections DetectionDecoder::decode(const InferenceResult& result) const {
  const std::size_t n = static_cast<std::size_t>(result.num_detections);

  // Candidates grouped by class so suppression never merges different classes.
  std::map<core::ClassId, core::Detections> by_class;
  for (std::size_t i = 0; i < n; ++i) {
    if (i * 4 + 3 >= result.boxes.size() || i >= result.scores.size() ||
        i >= result.class_ids.size()) {
      break;
    }
    const float score = result.scores[i];
    const core::ClassId cls = result.class_ids[i];
    if (score < params_.confidence_threshold || !params_.accepts_class(cls)) {
      continue;
    }
    core::BBox box{result.boxes[i * 4 + 0] * scale_x_, result.boxes[i * 4 + 1] * scale_y_,
                   result.boxes[i * 4 + 2] * scale_x_, result.boxes[i * 4 + 3] * scale_y_};
    box.x1 = std::clamp(box.x1, 0.f, image_width_);
    box.x2 = std::clamp(box.x2, 0.f, image_width_);
    box.y1 = std::clamp(box.y1, 0.f, image_height_);
    box.y2 = std::clamp(box.y2, 0.f, image_height_);
    if (box.width() <= 0.f || box.height() <= 0.f) continue;
    by_class[cls].add(box, cls, score);
  }

  core::Detections out;
  for (const auto& [cls, group] : by_class) {
    auto keep = core::suppress(group.confidences, group.boxes, core::MatchMetric::IOU,
                               params_.iou_threshold);
    if (!keep) {
      core::log::e("decoder: suppression failed: " + std::string(core::to_string(keep.error())));
      continue;
    }
    for (const std::size_t k : *keep) {
      out.add(group.boxes[k], cls, group.confidences[k]);
    }
  }
  return out;
}

}  // namespace tilefuse::vision
