#include <tilefuse/app/pipeline_runner.hpp>
#include <tilefuse/app/pipeline_runner_tbb.hpp>
#include <tilefuse/core/fusion.hpp>
#include <tilefuse/core/log.hpp>
#include <tilefuse/vision/remap.hpp>
#include <tilefuse/vision/tiler.hpp>
#include <algorithm>
#include <chrono>
#include <exception>
#include <memory>
#include <mutex>
#include <queue>
#include <string>
#include <thread>
#include <vector>

namespace tilefuse::app {

namespace {

std::size_t effective_workers(std::size_t num_workers) {
  if (num_workers > 0) return num_workers;
  const unsigned hw = std::thread::hardware_concurrency();
  return hw > 0 ? static_cast<std::size_t>(hw) : 1;
}

std::size_t count_failed(std::span<const core::Crop> crops) {
  return static_cast<std::size_t>(std::count_if(
      crops.begin(), crops.end(),
      [](const core::Crop& c) { return c.inference_error().has_value(); }));
}

void fail_crop(core::Crop& crop, core::PipelineError error, const std::string& why) {
  core::log::w("inference: tile " + std::to_string(crop.tile_index()) + " failed: " + why);
  crop.set_inference_failed(error);
}

/// Measures one phase and reports it to the optional callback.
class PhaseTimer {
 public:
  PhaseTimer(PhaseTimingCallback* cb, Phase phase)
      : cb_(cb), phase_(phase), start_(std::chrono::steady_clock::now()) {}

  ~PhaseTimer() {
    if (!cb_) return;
    const auto end = std::chrono::steady_clock::now();
    const double ms = 1e-3 * static_cast<double>(
        std::chrono::duration_cast<std::chrono::microseconds>(end - start_).count());
    try {
      (*cb_)(static_cast<std::size_t>(phase_), ms);
    } catch (const std::exception& e) {
      core::log::w(std::string("timing: callback threw: ") + e.what());
    } catch (...) {
      core::log::w("timing: callback threw an unknown exception");
    }
  }

  PhaseTimer(const PhaseTimer&) = delete;
  PhaseTimer& operator=(const PhaseTimer&) = delete;

 private:
  PhaseTimingCallback* cb_;
  Phase phase_;
  std::chrono::steady_clock::time_point start_;
};

}  // namespace

void infer_crop(core::Crop& crop,
                vision::IDetectionSource& source,
                const vision::InferenceParams& params) {
  std::expected<core::Detections, core::PipelineError> result =
      std::unexpected(core::PipelineError::InferenceFailed);
  try {
    auto valid = source.validate_input(crop.local_image());
    if (!valid) {
      fail_crop(crop, valid.error(), std::string(core::to_string(valid.error())));
      return;
    }
    result = source.infer(crop.local_image(), params);
  } catch (const std::exception& e) {
    fail_crop(crop, core::PipelineError::InferenceFailed, e.what());
    return;
  } catch (...) {
    fail_crop(crop, core::PipelineError::InferenceFailed, "unknown exception");
    return;
  }
  if (!result) {
    fail_crop(crop, result.error(), std::string(core::to_string(result.error())));
    return;
  }

  core::Detections detections = std::move(*result);
  const std::size_t n = detections.size();
  if (detections.classes.size() != n || detections.confidences.size() != n) {
    fail_crop(crop, core::PipelineError::DecoderError, "detection lists differ in length");
    return;
  }
  if (!params.segment) {
    detections.masks.clear();
  }
  crop.set_detections(std::move(detections));
}

std::size_t infer_crops(std::span<core::Crop> crops,
                        vision::IDetectionSource& source,
                        const vision::InferenceParams& params,
                        std::size_t num_workers) {
  const std::size_t n = crops.size();
  if (n == 0) return 0;

  std::size_t workers = std::min(effective_workers(num_workers), n);
  if (workers > 1 && !source.thread_safe()) {
    core::log::d("inference: source is not thread-safe, running crops sequentially");
    workers = 1;
  }
  if (workers <= 1) {
    for (auto& crop : crops) {
      infer_crop(crop, source, params);
    }
    return count_failed(crops);
  }

  std::queue<std::size_t> index_queue;
  for (std::size_t i = 0; i < n; ++i) {
    index_queue.push(i);
  }
  std::mutex queue_mutex;

  auto worker = [&]() {
    while (true) {
      std::size_t idx;
      {
        std::lock_guard lock(queue_mutex);
        if (index_queue.empty()) break;
        idx = index_queue.front();
        index_queue.pop();
      }
      infer_crop(crops[idx], source, params);
    }
  };

  std::vector<std::thread> threads;
  threads.reserve(workers);
  for (std::size_t i = 0; i < workers; ++i) {
    threads.emplace_back(worker);
  }
  for (auto& t : threads) {
    t.join();
  }
  return count_failed(crops);
}

std::expected<core::FusedResult, core::PipelineError> run_pipeline(
    const core::FramePtr& image,
    vision::IDetectionSource& source,
    const PipelineConfig& config,
    PhaseTimingCallback* timing_cb) {
  auto valid = validate_config(config);
  if (!valid) {
    return std::unexpected(valid.error());
  }
  if (!image || !image->is_valid()) {
    return std::unexpected(core::PipelineError::InvalidFrame);
  }

  std::expected<vision::TilingResult, core::PipelineError> tiling =
      std::unexpected(core::PipelineError::InvalidConfig);
  {
    PhaseTimer timer(timing_cb, Phase::Tiling);
    tiling = vision::generate_tiles(image, config.tile);
  }
  if (!tiling) {
    return std::unexpected(tiling.error());
  }
  std::vector<core::Crop>& crops = tiling->crops;

  std::size_t failed = 0;
  {
    PhaseTimer timer(timing_cb, Phase::Inference);
    if (config.parallel_backend == ParallelBackend::Tbb) {
#ifdef TILEFUSE_HAS_TBB
      failed = infer_crops_tbb(crops, source, config.inference);
#else
      core::log::w("inference: built without TBB, using the thread pool");
      failed = infer_crops(crops, source, config.inference, config.num_workers);
#endif
    } else {
      failed = infer_crops(crops, source, config.inference, config.num_workers);
    }
  }

  std::size_t masks_dropped = 0;
  {
    PhaseTimer timer(timing_cb, Phase::Remap);
    for (auto& crop : crops) {
      vision::remap_to_canvas(crop, config.mask_placement);
      if (crop.masks_dropped()) ++masks_dropped;
      if (config.tile.resize_to_original) {
        vision::scale_to_original(crop);
      }
    }
  }

  std::expected<core::FusedResult, core::PipelineError> fused =
      std::unexpected(core::PipelineError::InvalidConfig);
  {
    PhaseTimer timer(timing_cb, Phase::Fusion);
    fused = core::fuse(crops, config.class_names, config.fusion, config.inference.segment);
  }
  if (!fused) {
    return std::unexpected(fused.error());
  }

  const core::Frame& frame = config.tile.resize_to_original ? *tiling->original : *tiling->canvas;
  fused->image_width = frame.width();
  fused->image_height = frame.height();
  fused->canvas_width = tiling->canvas->width();
  fused->canvas_height = tiling->canvas->height();
  fused->tiles_total = tiling->grid.tile_count();
  fused->tiles_skipped = tiling->tiles_skipped;
  fused->crops_failed = failed;
  fused->crops_masks_dropped = masks_dropped;

  if (failed > 0 || tiling->tiles_skipped > 0) {
    core::log::w("run: " + std::to_string(failed) + " crop(s) failed, " +
                 std::to_string(tiling->tiles_skipped) + " tile(s) skipped");
  }
  return fused;
}

std::expected<core::FusedResult, core::PipelineError> run_pipeline(
    const core::Frame& image,
    vision::IDetectionSource& source,
    const PipelineConfig& config,
    PhaseTimingCallback* timing_cb) {
  return run_pipeline(std::make_shared<const core::Frame>(image), source, config, timing_cb);
}

}  // namespace tilefuse::app
