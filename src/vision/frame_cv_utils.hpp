#pragma once

#include <tilefuse/core/frame.hpp>
#include <tilefuse/core/mask.hpp>
#include <opencv2/core/mat.hpp>
#include <optional>

namespace tilefuse::vision::detail {

/// Non-owning cv::Mat view of a Frame. Returns nullopt if the frame is empty,
/// too small for its geometry or of unknown format. The view must not be written.
std::optional<cv::Mat> frame_to_mat(const tilefuse::core::Frame& frame);

/// Convert cv::Mat to Frame (copy; handles non-continuous ROIs).
tilefuse::core::Frame mat_to_frame(const cv::Mat& mat,
                                   tilefuse::core::PixelFormat format);

/// Non-owning CV_8UC1 view of a mask.
cv::Mat mask_to_mat(const tilefuse::core::BinaryMask& mask);

/// Copy a single-channel 8-bit Mat into a mask; any non-zero pixel is set.
tilefuse::core::BinaryMask mat_to_mask(const cv::Mat& mat);

/// Nearest-neighbour resize; keeps the mask strictly binary.
tilefuse::core::BinaryMask resize_mask(const tilefuse::core::BinaryMask& mask,
                                       std::uint32_t width,
                                       std::uint32_t height);

}  // namespace tilefuse::vision::detail
