#include <tilefuse/core/fusion.hpp>
#include <tilefuse/core/log.hpp>
#include <algorithm>
#include <string>
#include <unordered_set>

namespace tilefuse::core {

Detections aggregate(std::span<const Crop> crops) {
  std::size_t total = 0;
  bool any_masks = false;
  for (const auto& crop : crops) {
    total += crop.remapped().size();
    any_masks = any_masks || crop.remapped().has_masks();
  }

  Detections out;
  out.boxes.reserve(total);
  out.classes.reserve(total);
  out.confidences.reserve(total);
  if (any_masks) out.masks.reserve(total);

  for (const auto& crop : crops) {
    const Detections& d = crop.remapped();
    out.boxes.insert(out.boxes.end(), d.boxes.begin(), d.boxes.end());
    out.classes.insert(out.classes.end(), d.classes.begin(), d.classes.end());
    out.confidences.insert(out.confidences.end(), d.confidences.begin(), d.confidences.end());
    if (!any_masks) continue;
    if (d.has_masks()) {
      out.masks.insert(out.masks.end(), d.masks.begin(), d.masks.end());
    } else {
      out.masks.resize(out.masks.size() + d.size());
    }
  }
  return out;
}

std::string class_name(const ClassNameTable& names, ClassId id) {
  const auto it = names.find(id);
  if (it != names.end()) return it->second;
  return "class_" + std::to_string(id);
}

std::expected<FusedResult, PipelineError> fuse(std::span<const Crop> crops,
                                               const ClassNameTable& names,
                                               const FusionConfig& config,
                                               bool keep_masks) {
  Detections all = aggregate(crops);
  if (!all.is_consistent()) {
    return std::unexpected(PipelineError::DecoderError);
  }

  auto keep = suppress(all.confidences, all.boxes, config.match_metric, config.nms_threshold,
                       all.masks, config.intelligent_sorter);
  if (!keep) {
    return std::unexpected(keep.error());
  }
  log::d("fusion: " + std::to_string(all.size()) + " candidates, " +
         std::to_string(keep->size()) + " kept");

  FusedResult result;
  result.confidences.reserve(keep->size());
  result.boxes.reserve(keep->size());
  result.class_ids.reserve(keep->size());
  result.class_names.reserve(keep->size());

  std::unordered_set<ClassId> unnamed;
  for (const std::size_t i : *keep) {
    const ClassId id = all.classes[i];
    result.confidences.push_back(all.confidences[i]);
    result.boxes.push_back(all.boxes[i]);
    result.class_ids.push_back(id);
    result.class_names.push_back(class_name(names, id));
    if (!names.contains(id) && unnamed.insert(id).second) {
      log::w("fusion: no class name for id " + std::to_string(id));
    }
    if (keep_masks && all.has_masks()) {
      result.masks.push_back(std::move(all.masks[i]));
    }
  }
  return result;
}

}  // namespace tilefuse::core
