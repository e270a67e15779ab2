#include <tilefuse/core/error.hpp>

namespace tilefuse::core {

std::string_view to_string(PipelineError e) noexcept {
  switch (e) {
    case PipelineError::None:
      return "None";
    case PipelineError::InvalidFrame:
      return "InvalidFrame";
    case PipelineError::LoadFailed:
      return "LoadFailed";
    case PipelineError::InferenceFailed:
      return "InferenceFailed";
    case PipelineError::InvalidConfig:
      return "InvalidConfig";
    case PipelineError::DecoderError:
      return "DecoderError";
    case PipelineError::MaskShapeMismatch:
      return "MaskShapeMismatch";
  }
  return "Unknown";
}

}  // namespace tilefuse::core
