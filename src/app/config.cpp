#include <tilefuse/app/config.hpp>
#include <tilefuse/core/log.hpp>
#include <cmath>
#include <cstdint>
#include <fstream>
#include <sstream>
#include <stdexcept>
#include <string_view>
#include <unordered_set>
#include <vector>

namespace tilefuse::app {

namespace {

void trim(std::string& s) {
  const auto start = s.find_first_not_of(" \t\r\n");
  if (start == std::string::npos) {
    s.clear();
    return;
  }
  const auto end = s.find_last_not_of(" \t\r\n");
  s = s.substr(start, end == std::string::npos ? std::string::npos : end - start + 1);
}

bool parse_line(std::string_view line, std::string& key, std::string& value) {
  const auto pos = line.find('=');
  if (pos == std::string_view::npos) return false;
  key.assign(line.substr(0, pos));
  value.assign(line.substr(pos + 1));
  trim(key);
  trim(value);
  return !key.empty();
}

bool parse_bool(const std::string& value) {
  if (value == "1" || value == "true" || value == "yes" || value == "on") return true;
  if (value == "0" || value == "false" || value == "no" || value == "off") return false;
  throw std::invalid_argument("not a boolean: " + value);
}

std::vector<std::string> split_list(const std::string& value) {
  std::vector<std::string> items;
  std::stringstream ss(value);
  std::string item;
  while (std::getline(ss, item, ',')) {
    trim(item);
    if (!item.empty()) items.push_back(item);
  }
  return items;
}

bool in_unit_range(float v) noexcept { return std::isfinite(v) && v >= 0.f && v <= 1.f; }

/// Applies one key; throws std::invalid_argument / std::out_of_range for bad values.
bool apply_key(PipelineConfig& c, const std::string& key, const std::string& value) {
  if (key == "tile_width") c.tile.tile_width = std::stoi(value);
  else if (key == "tile_height") c.tile.tile_height = std::stoi(value);
  else if (key == "overlap_x") c.tile.overlap_x_pct = std::stof(value);
  else if (key == "overlap_y") c.tile.overlap_y_pct = std::stof(value);
  else if (key == "resize_to_original") c.tile.resize_to_original = parse_bool(value);
  else if (key == "image_size") c.inference.image_size = static_cast<std::uint32_t>(std::stoul(value));
  else if (key == "confidence_threshold") c.inference.confidence_threshold = std::stof(value);
  else if (key == "iou_threshold") c.inference.iou_threshold = std::stof(value);
  else if (key == "segment") c.inference.segment = parse_bool(value);
  else if (key == "classes") {
    if (value.empty() || value == "all") {
      c.inference.class_filter.reset();
    } else {
      std::unordered_set<core::ClassId> ids;
      for (const auto& item : split_list(value)) ids.insert(std::stoll(item));
      c.inference.class_filter = std::move(ids);
    }
  }
  else if (key == "match_metric") {
    auto metric = core::parse_match_metric(value);
    if (!metric) throw std::invalid_argument("unknown match_metric: " + value);
    c.fusion.match_metric = *metric;
  }
  else if (key == "nms_threshold") c.fusion.nms_threshold = std::stof(value);
  else if (key == "intelligent_sorter") c.fusion.intelligent_sorter = parse_bool(value);
  else if (key == "mask_placement") {
    if (value == "stretch") c.mask_placement = vision::MaskPlacement::Stretch;
    else if (value == "composite") c.mask_placement = vision::MaskPlacement::Composite;
    else throw std::invalid_argument("unknown mask_placement: " + value);
  }
  else if (key == "backend_type") {
    if (value == "onnx") c.backend_type = DetectionBackendType::Onnx;
    else if (value == "mock") c.backend_type = DetectionBackendType::Mock;
    else throw std::invalid_argument("unknown backend_type: " + value);
  }
  else if (key == "model_path") c.model_path = value;
  else if (key == "num_workers") c.num_workers = static_cast<std::size_t>(std::stoul(value));
  else if (key == "parallel_backend") {
    if (value == "threads") c.parallel_backend = ParallelBackend::Threads;
    else if (value == "tbb") c.parallel_backend = ParallelBackend::Tbb;
    else throw std::invalid_argument("unknown parallel_backend: " + value);
  }
  else if (key == "class_names") {
    c.class_names.clear();
    core::ClassId id = 0;
    for (const auto& name : split_list(value)) c.class_names.emplace(id++, name);
  }
  else return false;
  return true;
}

}  // namespace

PipelineConfig default_config() {
  PipelineConfig c;
  c.tile = vision::TileConfig{700, 700, 25.f, 25.f, false};
  c.inference.image_size = 640;
  c.inference.confidence_threshold = 0.5f;
  c.inference.iou_threshold = 0.7f;
  c.inference.segment = false;
  c.fusion = core::FusionConfig{core::MatchMetric::IOS, 0.3f, true};
  c.mask_placement = vision::MaskPlacement::Stretch;
  c.backend_type = DetectionBackendType::Mock;
  c.num_workers = 1;
  return c;
}

std::expected<PipelineConfig, core::PipelineError> load_config(const std::string& path) {
  PipelineConfig c = default_config();
  std::ifstream f(path);
  if (!f) {
    core::log::e("config: cannot open " + path);
    return std::unexpected(core::PipelineError::LoadFailed);
  }

  std::string line;
  std::string key;
  std::string value;
  std::size_t line_no = 0;
  while (std::getline(f, line)) {
    ++line_no;
    trim(line);
    if (line.empty() || line[0] == '#') continue;
    if (!parse_line(line, key, value)) continue;

    try {
      if (!apply_key(c, key, value)) {
        core::log::w("config: " + path + ":" + std::to_string(line_no) + ": unknown key '" + key + "'");
      }
    } catch (const std::exception& e) {
      core::log::e("config: " + path + ":" + std::to_string(line_no) + ": bad value for '" + key +
                   "': " + e.what());
      return std::unexpected(core::PipelineError::InvalidConfig);
    }
  }
  return c;
}

std::expected<void, core::PipelineError> validate_config(const PipelineConfig& config) {
  const auto& t = config.tile;
  if (t.tile_width <= 0 || t.tile_height <= 0) {
    core::log::e("config: tile size must be positive");
    return std::unexpected(core::PipelineError::InvalidConfig);
  }
  if (!(t.overlap_x_pct >= 0.f && t.overlap_x_pct < 100.f) ||
      !(t.overlap_y_pct >= 0.f && t.overlap_y_pct < 100.f)) {
    core::log::e("config: overlap must be in [0, 100)");
    return std::unexpected(core::PipelineError::InvalidConfig);
  }
  if (config.fusion.match_metric != core::MatchMetric::IOU &&
      config.fusion.match_metric != core::MatchMetric::IOS) {
    core::log::e("config: unknown match metric");
    return std::unexpected(core::PipelineError::InvalidConfig);
  }
  if (!in_unit_range(config.fusion.nms_threshold) ||
      !in_unit_range(config.inference.confidence_threshold) ||
      !in_unit_range(config.inference.iou_threshold)) {
    core::log::e("config: thresholds must be in [0, 1]");
    return std::unexpected(core::PipelineError::InvalidConfig);
  }
  if (config.inference.image_size == 0) {
    core::log::e("config: image_size must be positive");
    return std::unexpected(core::PipelineError::InvalidConfig);
  }
  return {};
}

}  // namespace tilefuse::app
