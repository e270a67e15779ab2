#pragma once

#include <tilefuse/app/config.hpp>
#include <tilefuse/core/crop.hpp>
#include <tilefuse/core/error.hpp>
#include <tilefuse/core/frame.hpp>
#include <tilefuse/core/fused_result.hpp>
#include <tilefuse/vision/detection_source.hpp>
#include <cstddef>
#include <expected>
#include <functional>
#include <span>

namespace tilefuse::app {

/// Phases reported to PhaseTimingCallback, in run order.
enum class Phase : std::size_t {
  Tiling = 0,
  Inference = 1,
  Remap = 2,
  Fusion = 3,
};

/// Optional per-phase timing: (phase_index, duration_ms). Pass to run_pipeline to get timings.
using PhaseTimingCallback = std::function<void(std::size_t phase_index, double duration_ms)>;

/// Runs \p source on one crop and records detections or the failure on it.
/// Source errors and exceptions mark the crop failed; they never propagate.
void infer_crop(core::Crop& crop,
                vision::IDetectionSource& source,
                const vision::InferenceParams& params);

/// Runs infer_crop on every crop. With num_workers > 1 (0 = hardware concurrency)
/// and a thread-safe source, crops are spread over a thread pool; otherwise they
/// run in order on the calling thread. Returns the number of failed crops.
std::size_t infer_crops(std::span<core::Crop> crops,
                        vision::IDetectionSource& source,
                        const vision::InferenceParams& params,
                        std::size_t num_workers = 1);

/// Tiles \p image, runs \p source per crop, remaps and fuses.
///
/// Configuration errors (InvalidConfig) and bad images (InvalidFrame) fail the
/// run before any tiling. Skipped tiles, failed crops and dropped masks do not;
/// they are counted in the returned FusedResult.
/// If timing_cb is non-null, it is invoked for each Phase with (phase_index, duration_ms).
/// An exception thrown by the callback is logged and does not fail the run.
[[nodiscard]] std::expected<core::FusedResult, core::PipelineError> run_pipeline(
    const core::FramePtr& image,
    vision::IDetectionSource& source,
    const PipelineConfig& config,
    PhaseTimingCallback* timing_cb = nullptr);

/// Same as above; copies \p image into a shared buffer first.
[[nodiscard]] std::expected<core::FusedResult, core::PipelineError> run_pipeline(
    const core::Frame& image,
    vision::IDetectionSource& source,
    const PipelineConfig& config,
    PhaseTimingCallback* timing_cb = nullptr);

}  // namespace tilefuse::app
