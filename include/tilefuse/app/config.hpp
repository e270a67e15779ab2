#pragma once

#include <tilefuse/core/error.hpp>
#include <tilefuse/core/fusion.hpp>
#include <tilefuse/vision/detection_source.hpp>
#include <tilefuse/vision/remap.hpp>
#include <tilefuse/vision/tiler.hpp>
#include <cstddef>
#include <expected>
#include <string>

namespace tilefuse::app {

/// Detection backend type: mock (synthetic) or onnx (real model).
enum class DetectionBackendType {
  Mock,
  Onnx,
};

/// How per-crop inference is spread over threads.
enum class ParallelBackend {
  Threads,  // std::thread pool, num_workers threads
  Tbb,      // tbb::parallel_for (needs a TBB build)
};

/// Full run configuration: tiling, inference, fusion and runner settings.
struct PipelineConfig {
  vision::TileConfig tile;
  vision::InferenceParams inference;
  core::FusionConfig fusion;
  vision::MaskPlacement mask_placement{vision::MaskPlacement::Stretch};

  DetectionBackendType backend_type{DetectionBackendType::Mock};
  std::string model_path;
  std::size_t num_workers{1};  // 0 = hardware concurrency
  ParallelBackend parallel_backend{ParallelBackend::Threads};

  core::ClassNameTable class_names;
};

/// Default config when no file is provided.
PipelineConfig default_config();

/// Load config from a key=value file (one per line, '#' comments) on top of
/// default_config(). LoadFailed if the file cannot be opened; InvalidConfig
/// for unknown enum values or malformed numbers.
[[nodiscard]] std::expected<PipelineConfig, core::PipelineError> load_config(
    const std::string& path);

/// Image-independent checks: tile size, overlap range, thresholds.
/// Tile-versus-image size is checked when tiling.
[[nodiscard]] std::expected<void, core::PipelineError> validate_config(
    const PipelineConfig& config);

}  // namespace tilefuse::app
