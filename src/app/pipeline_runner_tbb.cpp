#include <tilefuse/app/pipeline_runner_tbb.hpp>

#ifdef TILEFUSE_HAS_TBB

#include <tilefuse/app/pipeline_runner.hpp>
#include <tbb/blocked_range.h>
#include <tbb/parallel_for.h>
#include <algorithm>
#include <cstddef>

namespace tilefuse::app {

std::size_t infer_crops_tbb(std::span<core::Crop> crops,
                            vision::IDetectionSource& source,
                            const vision::InferenceParams& params) {
  if (crops.empty()) return 0;
  if (!source.thread_safe()) {
    return infer_crops(crops, source, params, 1);
  }

  tbb::parallel_for(
      tbb::blocked_range<std::size_t>(0, crops.size()),
      [&crops, &source, &params](const tbb::blocked_range<std::size_t>& range) {
        for (std::size_t i = range.begin(); i != range.end(); ++i) {
          infer_crop(crops[i], source, params);
        }
      });

  return static_cast<std::size_t>(std::count_if(
      crops.begin(), crops.end(),
      [](const core::Crop& c) { return c.inference_error().has_value(); }));
}

}  // namespace tilefuse::app

#endif  // TILEFUSE_HAS_TBB
