#include <tilefuse/app/pipeline_runner.hpp>
#include <tilefuse/vision/mock_detection_source.hpp>
#include <tilefuse/vision/tiler.hpp>
#include <gtest/gtest.h>
#include <algorithm>
#include <atomic>
#include <chrono>
#include <memory>
#include <stdexcept>
#include <thread>
#include <vector>

namespace ta = tilefuse::app;
namespace tc = tilefuse::core;
namespace tv = tilefuse::vision;

namespace {

tc::FramePtr make_gray(std::uint32_t w, std::uint32_t h) {
  std::vector<std::byte> buf(static_cast<std::size_t>(w) * h);
  return std::make_shared<const tc::Frame>(w, h, tc::PixelFormat::Grayscale8, std::move(buf));
}

/// Six 100x100 crops of a 300x200 image.
std::vector<tc::Crop> make_crops() {
  auto tiles = tv::generate_tiles(make_gray(300, 200), tv::TileConfig{100, 100, 0.f, 0.f, false});
  EXPECT_TRUE(tiles.has_value());
  return tiles ? std::move(tiles->crops) : std::vector<tc::Crop>{};
}

class ThrowingSource : public tv::IDetectionSource {
 public:
  std::expected<tc::Detections, tc::PipelineError> infer(const tc::Frame&,
                                                         const tv::InferenceParams&) override {
    throw std::runtime_error("device lost");
  }
};

/// Throws a value that is not a std::exception.
class ThrowsIntSource : public tv::IDetectionSource {
 public:
  std::expected<tc::Detections, tc::PipelineError> infer(const tc::Frame&,
                                                         const tv::InferenceParams&) override {
    throw 42;
  }
  [[nodiscard]] bool thread_safe() const noexcept override { return true; }
};

/// Input validation throws before infer() is reached.
class ThrowingValidateSource : public tv::IDetectionSource {
 public:
  std::expected<tc::Detections, tc::PipelineError> infer(const tc::Frame&,
                                                         const tv::InferenceParams&) override {
    ++infer_calls;
    return tc::Detections{};
  }
  [[nodiscard]] std::expected<void, tc::PipelineError> validate_input(
      const tc::Frame&) const override {
    throw std::invalid_argument("bad tile");
  }

  int infer_calls{0};
};

/// Fails on its first call only.
class FirstCallFailsSource : public tv::IDetectionSource {
 public:
  std::expected<tc::Detections, tc::PipelineError> infer(const tc::Frame&,
                                                         const tv::InferenceParams&) override {
    if (calls_++ == 0) return std::unexpected(tc::PipelineError::InferenceFailed);
    tc::Detections d;
    d.add({1.f, 1.f, 9.f, 9.f}, 0, 0.9f);
    return d;
  }

 private:
  int calls_{0};
};

/// Records the largest number of overlapping infer() calls.
class ConcurrencyProbeSource : public tv::IDetectionSource {
 public:
  explicit ConcurrencyProbeSource(bool thread_safe) : thread_safe_(thread_safe) {}

  std::expected<tc::Detections, tc::PipelineError> infer(const tc::Frame&,
                                                         const tv::InferenceParams&) override {
    const int now = ++active_;
    int seen = peak_.load();
    while (now > seen && !peak_.compare_exchange_weak(seen, now)) {
    }
    std::this_thread::sleep_for(std::chrono::milliseconds(5));
    --active_;
    return tc::Detections{};
  }
  [[nodiscard]] bool thread_safe() const noexcept override { return thread_safe_; }
  [[nodiscard]] int peak() const { return peak_.load(); }

 private:
  bool thread_safe_;
  std::atomic<int> active_{0};
  std::atomic<int> peak_{0};
};

/// Returns a mask list one entry short of the box list.
class ShortMaskListSource : public tv::IDetectionSource {
 public:
  std::expected<tc::Detections, tc::PipelineError> infer(const tc::Frame& image,
                                                         const tv::InferenceParams&) override {
    tc::Detections d;
    d.add({1.f, 1.f, 9.f, 9.f}, 0, 0.9f, tc::BinaryMask(image.width(), image.height()));
    d.add({20.f, 20.f, 29.f, 29.f}, 0, 0.8f);
    return d;
  }
};

}  // namespace

TEST(InferCrop, RecordsDetections) {
  auto crops = make_crops();
  ASSERT_FALSE(crops.empty());
  tv::MockDetectionSource mock;
  tc::Detections d;
  d.add({1.f, 2.f, 3.f, 4.f}, 5, 0.9f);
  mock.set_detections(d);
  ta::infer_crop(crops[0], mock, tv::InferenceParams{});
  EXPECT_EQ(crops[0].state(), tc::CropState::Inferred);
  EXPECT_FALSE(crops[0].inference_error().has_value());
  ASSERT_EQ(crops[0].detections().size(), 1u);
  EXPECT_EQ(crops[0].detections().classes[0], 5);
}

TEST(InferCrop, ExceptionMarksCropFailed) {
  auto crops = make_crops();
  ASSERT_FALSE(crops.empty());
  ThrowingSource source;
  ta::infer_crop(crops[0], source, tv::InferenceParams{});
  ASSERT_TRUE(crops[0].inference_error().has_value());
  EXPECT_EQ(*crops[0].inference_error(), tc::PipelineError::InferenceFailed);
  EXPECT_TRUE(crops[0].detections().empty());
}

TEST(InferCrop, NonStandardExceptionMarksCropFailed) {
  auto crops = make_crops();
  ASSERT_FALSE(crops.empty());
  ThrowsIntSource source;
  ta::infer_crop(crops[0], source, tv::InferenceParams{});
  ASSERT_TRUE(crops[0].inference_error().has_value());
  EXPECT_EQ(*crops[0].inference_error(), tc::PipelineError::InferenceFailed);
}

TEST(InferCrop, ThrowingValidateInputMarksCropFailed) {
  auto crops = make_crops();
  ASSERT_FALSE(crops.empty());
  ThrowingValidateSource source;
  ta::infer_crop(crops[0], source, tv::InferenceParams{});
  ASSERT_TRUE(crops[0].inference_error().has_value());
  EXPECT_EQ(*crops[0].inference_error(), tc::PipelineError::InferenceFailed);
  EXPECT_EQ(source.infer_calls, 0);
}

TEST(InferCrops, NonStandardExceptionsInThreadPoolAreCounted) {
  auto crops = make_crops();
  ASSERT_EQ(crops.size(), 6u);
  ThrowsIntSource source;
  EXPECT_EQ(ta::infer_crops(crops, source, tv::InferenceParams{}, 2), 6u);
  for (const auto& crop : crops) {
    EXPECT_TRUE(crop.inference_error().has_value());
  }
}

TEST(InferCrops, CountsFailures) {
  auto crops = make_crops();
  FirstCallFailsSource source;
  EXPECT_EQ(ta::infer_crops(crops, source, tv::InferenceParams{}), 1u);
  EXPECT_TRUE(crops[0].inference_error().has_value());
  for (std::size_t i = 1; i < crops.size(); ++i) {
    EXPECT_EQ(crops[i].detections().size(), 1u);
  }
}

TEST(InferCrops, ThreadPoolRunsEveryCropOnce) {
  auto crops = make_crops();
  tv::MockDetectionSource mock;
  tc::Detections d;
  d.add({1.f, 2.f, 3.f, 4.f}, 0, 0.9f);
  mock.set_detections(d);
  EXPECT_EQ(ta::infer_crops(crops, mock, tv::InferenceParams{}, 4), 0u);
  EXPECT_EQ(mock.call_count(), crops.size());
  for (const auto& crop : crops) {
    EXPECT_EQ(crop.state(), tc::CropState::Inferred);
    EXPECT_EQ(crop.detections().size(), 1u);
  }
}

TEST(InferCrops, NonThreadSafeSourceRunsSequentially) {
  auto crops = make_crops();
  ConcurrencyProbeSource source(false);
  EXPECT_EQ(ta::infer_crops(crops, source, tv::InferenceParams{}, 4), 0u);
  EXPECT_EQ(source.peak(), 1);
}

TEST(RunPipeline, ReportsDiagnostics) {
  tv::MockDetectionSource mock;
  tc::Detections d;
  d.add({10.f, 10.f, 20.f, 20.f}, 0, 0.9f);
  mock.set_detections(d);
  ta::PipelineConfig config = ta::default_config();
  config.tile = tv::TileConfig{100, 100, 0.f, 0.f, false};
  config.class_names = {{0, "pallet"}};

  auto result = ta::run_pipeline(make_gray(300, 200), mock, config);
  ASSERT_TRUE(result.has_value());
  EXPECT_EQ(result->tiles_total, 6u);
  EXPECT_EQ(result->tiles_skipped, 0u);
  EXPECT_EQ(result->crops_failed, 0u);
  EXPECT_EQ(result->image_width, 300u);
  EXPECT_EQ(result->canvas_width, 300u);
  // One box per tile, at a different offset each time: nothing to merge.
  ASSERT_EQ(result->size(), 6u);
  EXPECT_EQ(result->class_names[0], "pallet");
}

TEST(RunPipeline, FailedCropsDoNotFailRun) {
  tv::MockDetectionSource mock;
  mock.set_failure(tc::PipelineError::InferenceFailed);
  ta::PipelineConfig config = ta::default_config();
  config.tile = tv::TileConfig{100, 100, 0.f, 0.f, false};
  auto result = ta::run_pipeline(make_gray(300, 200), mock, config);
  ASSERT_TRUE(result.has_value());
  EXPECT_TRUE(result->empty());
  EXPECT_EQ(result->crops_failed, 6u);
}

TEST(RunPipeline, ShortMaskListDropsMasksOnly) {
  ShortMaskListSource source;
  ta::PipelineConfig config = ta::default_config();
  config.tile = tv::TileConfig{100, 100, 0.f, 0.f, false};
  config.inference.segment = true;
  auto result = ta::run_pipeline(make_gray(200, 100), source, config);
  ASSERT_TRUE(result.has_value());
  EXPECT_EQ(result->crops_masks_dropped, 2u);
  EXPECT_EQ(result->size(), 4u);
  EXPECT_TRUE(result->masks.empty());
}

TEST(RunPipeline, RejectsBadInput) {
  tv::MockDetectionSource mock;
  ta::PipelineConfig config = ta::default_config();

  auto empty = ta::run_pipeline(std::make_shared<const tc::Frame>(), mock, config);
  ASSERT_FALSE(empty.has_value());
  EXPECT_EQ(empty.error(), tc::PipelineError::InvalidFrame);

  // Default 700x700 tiles do not fit a 300x200 image.
  auto small = ta::run_pipeline(make_gray(300, 200), mock, config);
  ASSERT_FALSE(small.has_value());
  EXPECT_EQ(small.error(), tc::PipelineError::InvalidConfig);

  config.tile = tv::TileConfig{100, 100, 0.f, 0.f, false};
  config.fusion.match_metric = static_cast<tc::MatchMetric>(5);
  auto metric = ta::run_pipeline(make_gray(300, 200), mock, config);
  ASSERT_FALSE(metric.has_value());
  EXPECT_EQ(metric.error(), tc::PipelineError::InvalidConfig);
  EXPECT_EQ(mock.call_count(), 0u);
}

TEST(RunPipeline, TimingCallbackInvokedPerPhase) {
  tv::MockDetectionSource mock;
  ta::PipelineConfig config = ta::default_config();
  config.tile = tv::TileConfig{100, 100, 0.f, 0.f, false};

  std::vector<std::size_t> phases;
  std::vector<double> durations;
  ta::PhaseTimingCallback cb = [&](std::size_t phase, double ms) {
    phases.push_back(phase);
    durations.push_back(ms);
  };
  auto result = ta::run_pipeline(make_gray(300, 200), mock, config, &cb);
  ASSERT_TRUE(result.has_value());
  EXPECT_EQ(phases, (std::vector<std::size_t>{0, 1, 2, 3}));
  for (double ms : durations) {
    EXPECT_GE(ms, 0.0);
  }
}

TEST(RunPipeline, ThrowingTimingCallbackDoesNotFailRun) {
  tv::MockDetectionSource mock;
  ta::PipelineConfig config = ta::default_config();
  config.tile = tv::TileConfig{100, 100, 0.f, 0.f, false};

  std::size_t calls = 0;
  ta::PhaseTimingCallback cb = [&](std::size_t, double) {
    ++calls;
    throw std::runtime_error("sink closed");
  };
  auto result = ta::run_pipeline(make_gray(300, 200), mock, config, &cb);
  ASSERT_TRUE(result.has_value());
  EXPECT_EQ(result->tiles_total, 6u);
  EXPECT_EQ(calls, 4u);
}

TEST(RunPipeline, FrameOverloadCopiesImage) {
  tv::MockDetectionSource mock;
  ta::PipelineConfig config = ta::default_config();
  config.tile = tv::TileConfig{100, 100, 0.f, 0.f, false};
  tc::FramePtr image = make_gray(300, 200);
  auto result = ta::run_pipeline(*image, mock, config);
  ASSERT_TRUE(result.has_value());
  EXPECT_EQ(result->tiles_total, 6u);
}
