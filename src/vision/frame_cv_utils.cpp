#include "frame_cv_utils.hpp"
#include <tilefuse/core/frame.hpp>
#include <opencv2/core.hpp>
#include <opencv2/imgproc.hpp>
#include <cstddef>
#include <cstring>
#include <vector>

namespace tilefuse::vision::detail {

namespace tc = tilefuse::core;

std::optional<cv::Mat> frame_to_mat(const tc::Frame& frame) {
  if (frame.empty() || !frame.is_valid()) return std::nullopt;

  const int w = static_cast<int>(frame.width());
  const int h = static_cast<int>(frame.height());
  const std::size_t step = frame.row_bytes();
  void* data = const_cast<std::byte*>(frame.data().data());

  switch (frame.channels()) {
    case 1:
      return cv::Mat(h, w, CV_8UC1, data, step);
    case 3:
      return cv::Mat(h, w, CV_8UC3, data, step);
    case 4:
      return cv::Mat(h, w, CV_8UC4, data, step);
    default:
      return std::nullopt;
  }
}

tc::Frame mat_to_frame(const cv::Mat& mat, tc::PixelFormat format) {
  if (mat.empty()) return tc::Frame();

  const cv::Mat packed = mat.isContinuous() ? mat : mat.clone();
  const std::uint32_t w = static_cast<std::uint32_t>(packed.cols);
  const std::uint32_t h = static_cast<std::uint32_t>(packed.rows);
  const std::size_t len = packed.total() * packed.elemSize();
  std::vector<std::byte> buffer(len);
  std::memcpy(buffer.data(), packed.ptr(), len);
  return tc::Frame(w, h, format, std::move(buffer));
}

cv::Mat mask_to_mat(const tc::BinaryMask& mask) {
  return cv::Mat(static_cast<int>(mask.height()), static_cast<int>(mask.width()), CV_8UC1,
                 const_cast<std::uint8_t*>(mask.pixels().data()));
}

tc::BinaryMask mat_to_mask(const cv::Mat& mat) {
  tc::BinaryMask mask(static_cast<std::uint32_t>(mat.cols), static_cast<std::uint32_t>(mat.rows));
  for (int y = 0; y < mat.rows; ++y) {
    const std::uint8_t* row = mat.ptr<std::uint8_t>(y);
    for (int x = 0; x < mat.cols; ++x) {
      if (row[x] != 0) mask.set(static_cast<std::uint32_t>(x), static_cast<std::uint32_t>(y), true);
    }
  }
  return mask;
}

tc::BinaryMask resize_mask(const tc::BinaryMask& mask, std::uint32_t width, std::uint32_t height) {
  if (mask.empty()) return tc::BinaryMask();
  if (mask.width() == width && mask.height() == height) return mask;

  cv::Mat resized;
  cv::resize(mask_to_mat(mask), resized,
             cv::Size(static_cast<int>(width), static_cast<int>(height)),
             0, 0, cv::INTER_NEAREST);
  return mat_to_mask(resized);
}

}  // namespace tilefuse::vision::detail
