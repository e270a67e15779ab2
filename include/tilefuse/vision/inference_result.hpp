#pragma once

#include <cstdint>
#include <vector>

namespace tilefuse::vision {

/// Raw model output in model-input pixel coordinates, before decoding.
struct InferenceResult {
  std::vector<float> boxes;  // [x1,y1,x2,y2] per detection
  std::vector<float> scores;
  std::vector<std::int64_t> class_ids;
  std::uint32_t num_detections{0};
};

}  // namespace tilefuse::vision
