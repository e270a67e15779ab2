#pragma once

#include <tilefuse/core/error.hpp>
#include <tilefuse/core/frame.hpp>
#include <expected>
#include <string>

namespace tilefuse::vision {

/// Load an image file into a Frame (BGR8 or Grayscale8). LoadFailed if the file
/// is missing or cannot be decoded.
[[nodiscard]] std::expected<tilefuse::core::Frame, tilefuse::core::PipelineError>
load_frame_from_image(const std::string& path);

}  // namespace tilefuse::vision
