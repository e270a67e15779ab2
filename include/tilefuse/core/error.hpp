#pragma once

#include <string_view>

namespace tilefuse::core {

/// Pipeline error codes; used with std::expected for recoverable failures.
enum class PipelineError {
  None = 0,
  InvalidFrame,
  LoadFailed,
  InferenceFailed,
  InvalidConfig,
  DecoderError,
  MaskShapeMismatch,  // mask size does not match its tile or canvas
};

[[nodiscard]] std::string_view to_string(PipelineError e) noexcept;

}  // namespace tilefuse::core
