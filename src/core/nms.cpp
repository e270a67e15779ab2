#include <tilefuse/core/nms.hpp>
#include <algorithm>
#include <cctype>
#include <cmath>
#include <numeric>
#include <string>

namespace tilefuse::core {

namespace {

bool is_known(MatchMetric metric) noexcept {
  return metric == MatchMetric::IOU || metric == MatchMetric::IOS;
}

double ratio(double num, double den) noexcept { return den > 0.0 ? num / den : 0.0; }

double overlap_value(double inter, double area_a, double area_b, MatchMetric metric) noexcept {
  if (metric == MatchMetric::IOU) {
    return ratio(inter, area_a + area_b - inter);
  }
  return ratio(inter, std::min(area_a, area_b));
}

/// Python-style round(confidence, 1) expressed as an integer bucket (0..10).
long confidence_bucket(float confidence) noexcept {
  return static_cast<long>(std::nearbyint(static_cast<double>(confidence) * 10.0));
}

}  // namespace

std::expected<MatchMetric, PipelineError> parse_match_metric(std::string_view name) {
  std::string upper(name);
  std::transform(upper.begin(), upper.end(), upper.begin(),
                 [](unsigned char c) { return static_cast<char>(std::toupper(c)); });
  if (upper == "IOU") return MatchMetric::IOU;
  if (upper == "IOS") return MatchMetric::IOS;
  return std::unexpected(PipelineError::InvalidConfig);
}

std::string_view to_string(MatchMetric metric) noexcept {
  switch (metric) {
    case MatchMetric::IOU:
      return "IOU";
    case MatchMetric::IOS:
      return "IOS";
  }
  return "Unknown";
}

double box_match_value(const BBox& a, const BBox& b, MatchMetric metric) noexcept {
  return overlap_value(intersection_area(a, b), a.area(), b.area(), metric);
}

double mask_match_value(const BinaryMask& a, const BinaryMask& b, MatchMetric metric) noexcept {
  return overlap_value(static_cast<double>(intersection_count(a, b)),
                       static_cast<double>(a.count()),
                       static_cast<double>(b.count()), metric);
}

std::vector<std::size_t> priority_order(std::span<const float> confidences,
                                        std::span<const BBox> boxes,
                                        bool intelligent_sorter) {
  std::vector<std::size_t> order(confidences.size());
  std::iota(order.begin(), order.end(), std::size_t{0});

  if (intelligent_sorter) {
    std::stable_sort(order.begin(), order.end(), [&](std::size_t a, std::size_t b) {
      const long bucket_a = confidence_bucket(confidences[a]);
      const long bucket_b = confidence_bucket(confidences[b]);
      if (bucket_a != bucket_b) return bucket_a < bucket_b;
      return boxes[a].area() < boxes[b].area();
    });
  } else {
    std::stable_sort(order.begin(), order.end(), [&](std::size_t a, std::size_t b) {
      return confidences[a] < confidences[b];
    });
  }
  return order;
}

std::expected<std::vector<std::size_t>, PipelineError> suppress(
    std::span<const float> confidences,
    std::span<const BBox> boxes,
    MatchMetric metric,
    float threshold,
    std::span<const BinaryMask> masks,
    bool intelligent_sorter) {
  if (!is_known(metric)) {
    return std::unexpected(PipelineError::InvalidConfig);
  }
  if (confidences.size() != boxes.size() ||
      (!masks.empty() && masks.size() != boxes.size())) {
    return std::unexpected(PipelineError::InvalidConfig);
  }

  std::vector<std::size_t> keep;
  if (boxes.empty()) {
    return keep;
  }

  std::vector<std::size_t> order = priority_order(confidences, boxes, intelligent_sorter);
  std::vector<double> box_values;

  std::vector<double> mask_counts(masks.size());
  for (std::size_t i = 0; i < masks.size(); ++i) {
    mask_counts[i] = static_cast<double>(masks[i].count());
  }

  while (!order.empty()) {
    const std::size_t idx = order.back();
    order.pop_back();
    keep.push_back(idx);
    if (order.empty()) break;

    box_values.resize(order.size());
    bool any_overlap = false;
    for (std::size_t k = 0; k < order.size(); ++k) {
      box_values[k] = box_match_value(boxes[idx], boxes[order[k]], metric);
      any_overlap = any_overlap || box_values[k] > 0.0;
    }

    const bool mask_path = !masks.empty() && any_overlap;
    std::size_t out = 0;
    for (std::size_t k = 0; k < order.size(); ++k) {
      const std::size_t other = order[k];
      bool suppressed = false;
      if (!mask_path) {
        suppressed = box_values[k] > threshold;
      } else if (box_values[k] > 0.0) {
        if (masks[idx].empty() || masks[other].empty()) {
          suppressed = box_values[k] > threshold;
        } else {
          const double inter = static_cast<double>(intersection_count(masks[idx], masks[other]));
          suppressed =
              overlap_value(inter, mask_counts[idx], mask_counts[other], metric) > threshold;
        }
      }
      if (!suppressed) {
        order[out++] = other;
      }
    }
    order.resize(out);
  }
  return keep;
}

}  // namespace tilefuse::core
