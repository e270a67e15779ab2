/**
 * tilefuse-cli: sliced detection on a large image, prints fused detections.
 * Build: cmake -B build && cmake --build build
 * Run:   ./build/apps/tilefuse-cli/tilefuse_cli [--config path] [--input path]
 * With --input: also writes results to output/<basename>.txt (same content as terminal).
 */

#include <tilefuse/app/config.hpp>
#include <tilefuse/app/pipeline_runner.hpp>
#include <tilefuse/core/detection.hpp>
#include <tilefuse/core/frame.hpp>
#include <tilefuse/core/fused_result.hpp>
#include <tilefuse/core/log.hpp>
#include <tilefuse/vision/load_image.hpp>
#include <tilefuse/vision/mock_detection_source.hpp>
#ifdef TILEFUSE_HAS_ONNXRUNTIME
#include <tilefuse/vision/onnx_detection_source.hpp>
#endif

#include <cstdint>
#include <filesystem>
#include <fstream>
#include <iostream>
#include <memory>
#include <sstream>
#include <stdexcept>
#include <string>
#include <system_error>
#include <vector>

namespace {

std::unique_ptr<tilefuse::vision::IDetectionSource> build_source(
    const tilefuse::app::PipelineConfig& cfg) {
  using namespace tilefuse::core;
  using namespace tilefuse::vision;

  if (cfg.backend_type == tilefuse::app::DetectionBackendType::Onnx) {
#ifdef TILEFUSE_HAS_ONNXRUNTIME
    if (cfg.model_path.empty()) {
      throw std::runtime_error("backend_type=onnx requires model_path to be set in config");
    }
    auto onnx = std::make_unique<OnnxDetectionSource>(cfg.model_path);
    onnx->warmup();
    return onnx;
#else
    throw std::runtime_error("ONNX backend not available (build with ONNX Runtime installed)");
#endif
  }

  // Fixed tile-local detections; each tile reports them at its own offset.
  auto mock = std::make_unique<MockDetectionSource>();
  Detections d;
  d.add({40.f, 40.f, 200.f, 160.f}, 0, 0.91f);
  d.add({300.f, 320.f, 420.f, 480.f}, 1, 0.64f);
  mock->set_detections(std::move(d));
  return mock;
}

tilefuse::core::Frame make_dummy_frame(std::uint32_t w, std::uint32_t h) {
  const std::size_t bytes = static_cast<std::size_t>(w) * h * 3;
  std::vector<std::byte> buffer(bytes, std::byte{0});
  return tilefuse::core::Frame(w, h, tilefuse::core::PixelFormat::BGR8, std::move(buffer));
}

std::string format_result(const tilefuse::core::FusedResult& r) {
  std::ostringstream out;
  out << "detections=" << r.size() << " image=" << r.image_width << "x" << r.image_height
      << " canvas=" << r.canvas_width << "x" << r.canvas_height << " tiles=" << r.tiles_total
      << " skipped=" << r.tiles_skipped << " failed=" << r.crops_failed
      << " masks_dropped=" << r.crops_masks_dropped << "\n";
  for (std::size_t i = 0; i < r.size(); ++i) {
    const auto& b = r.boxes[i];
    out << "  " << r.class_names[i] << " (" << r.class_ids[i] << ") confidence=" << r.confidences[i]
        << " box=(" << b.x1 << "," << b.y1 << "," << b.x2 << "," << b.y2 << ")";
    if (i < r.masks.size() && !r.masks[i].empty()) {
      out << " mask_pixels=" << r.masks[i].count();
    }
    out << "\n";
  }
  return out.str();
}

} // namespace

int main(int argc, char* argv[]) {
  std::string config_path;
  std::string input_path;
  std::string backend_override;  // "mock" or "onnx"
  std::string model_override;

  for (int i = 1; i < argc; ++i) {
    const std::string arg = argv[i];
    if (arg == "--config" && i + 1 < argc) {
      config_path = argv[++i];
    } else if (arg == "--input" && i + 1 < argc) {
      input_path = argv[++i];
    } else if (arg == "--backend" && i + 1 < argc) {
      backend_override = argv[++i];
    } else if (arg == "--model" && i + 1 < argc) {
      model_override = argv[++i];
    } else if (arg == "--debug") {
      tilefuse::core::log::set_debug(true);
    } else if (arg == "--help" || arg == "-h") {
      std::cout << "Usage: tilefuse_cli [options] [--input <path>]\n"
                << "  --config <path>   Pipeline config (key=value file); default: built-in (mock)\n"
                << "  --backend <type>  Override backend: mock | onnx (default from config)\n"
                << "  --model <path>    Override model path (required for --backend onnx)\n"
                << "  --input <path>    Image path (optional; demo uses a synthetic 1500x1000 frame)\n"
                << "  --debug           Verbose diagnostics on stderr\n";
      return 0;
    } else {
      std::cerr << "Unknown argument " << arg << " (see --help)\n";
      return 1;
    }
  }

  tilefuse::app::PipelineConfig cfg = tilefuse::app::default_config();
  if (!config_path.empty()) {
    auto loaded = tilefuse::app::load_config(config_path);
    if (!loaded) {
      std::cerr << "Config error: " << tilefuse::core::to_string(loaded.error()) << "\n";
      return 1;
    }
    cfg = std::move(*loaded);
  }

  if (!backend_override.empty()) {
    if (backend_override == "mock") {
      cfg.backend_type = tilefuse::app::DetectionBackendType::Mock;
    } else if (backend_override == "onnx") {
      cfg.backend_type = tilefuse::app::DetectionBackendType::Onnx;
    } else {
      std::cerr << "Unknown --backend " << backend_override << " (use mock or onnx)\n";
      return 1;
    }
  }
  if (!model_override.empty()) {
    cfg.model_path = model_override;
  }

  std::unique_ptr<tilefuse::vision::IDetectionSource> source;
  try {
    source = build_source(cfg);
  } catch (const std::exception& e) {
    std::cerr << "Failed to create detection source: " << e.what() << "\n";
    return 1;
  }

  tilefuse::core::Frame frame;
  if (!input_path.empty()) {
    auto loaded = tilefuse::vision::load_frame_from_image(input_path);
    if (!loaded) {
      std::cerr << "Failed to load image: " << input_path << "\n";
      return 1;
    }
    frame = std::move(*loaded);
  } else {
    frame = make_dummy_frame(1500, 1000);
  }

  auto result = tilefuse::app::run_pipeline(frame, *source, cfg);
  if (!result) {
    std::cerr << "Pipeline error: " << tilefuse::core::to_string(result.error()) << "\n";
    return 1;
  }

  const std::string text = format_result(*result);
  std::cout << text;

  if (!input_path.empty()) {
    std::filesystem::path p(input_path);
    std::filesystem::path out_dir("output");
    std::error_code ec;
    std::filesystem::create_directories(out_dir, ec);
    std::filesystem::path out_file = out_dir / (p.stem().string() + ".txt");
    std::ofstream f(out_file);
    if (f) {
      f << text;
    } else {
      std::cerr << "Warning: could not write " << out_file << "\n";
    }
  }
  return 0;
}
