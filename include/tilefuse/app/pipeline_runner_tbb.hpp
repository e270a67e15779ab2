#pragma once

#include <tilefuse/core/crop.hpp>
#include <tilefuse/vision/detection_source.hpp>
#include <cstddef>
#include <span>

#ifdef TILEFUSE_HAS_TBB

namespace tilefuse::app {

/// Runs infer_crop on every crop in parallel using TBB.
///
/// Each crop is touched by exactly one task; the shared canvas and original
/// images are only read. \p source must be thread-safe (see
/// IDetectionSource::thread_safe); a non-thread-safe source is run in order on
/// the calling thread instead. Returns the number of failed crops.
std::size_t infer_crops_tbb(std::span<core::Crop> crops,
                            vision::IDetectionSource& source,
                            const vision::InferenceParams& params);

}  // namespace tilefuse::app

#endif  // TILEFUSE_HAS_TBB
