#pragma once

#include <neurolens/core/frame.hpp>
#include <opencv2/core/mat.hpp>
#include <cstdint>
#include <optional>

namespace neurolens::vision::detail {

/// Wrap a Frame as a cv::Mat view (no copy). Returns nullopt if format unsupported.
std::optional<cv::Mat> frame_to_mat(const neurolens::core::Frame& frame);

/// Convert cv::Mat to Frame (copy).
neurolens::core::Frame mat_to_frame(const cv::Mat& mat,
                                    neurolens::core::PixelFormat format);

/// Copy an interleaved HWC float buffer into planar CHW order.
void hwc_to_chw(const float* hwc, std::uint32_t h, std::uint32_t w,
                std::uint32_t channels, float* chw);

/// Copy planar CHW floats into interleaved HWC order.
void chw_to_hwc(const float* chw, std::uint32_t h, std::uint32_t w,
                std::uint32_t channels, float* hwc);

}  // namespace neurolens::vision::detail
