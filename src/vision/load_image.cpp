#include <tilefuse/vision/load_image.hpp>
#include "frame_cv_utils.hpp"
#include <tilefuse/core/frame.hpp>
#include <opencv2/imgcodecs.hpp>

namespace tilefuse::vision {

std::expected<tilefuse::core::Frame, tilefuse::core::PipelineError>
load_frame_from_image(const std::string& path) {
  cv::Mat mat = cv::imread(path, cv::IMREAD_UNCHANGED);
  if (mat.empty() || mat.depth() != CV_8U) {
    return std::unexpected(tilefuse::core::PipelineError::LoadFailed);
  }
  tilefuse::core::PixelFormat format = tilefuse::core::PixelFormat::BGR8;
  if (mat.channels() == 1) format = tilefuse::core::PixelFormat::Grayscale8;
  if (mat.channels() == 4) format = tilefuse::core::PixelFormat::BGRA8;
  return detail::mat_to_frame(mat, format);
}

}  // namespace tilefuse::vision
