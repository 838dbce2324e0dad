#pragma once

#include <opencv2/core/mat.hpp>

namespace marksman::vision::core {

//! Pixel margins cut off each side of a frame before detection.
struct CropMargins {
	int left{0};
	int right{0};
	int top{0};
	int bottom{0};
};

//! A frame is an 8-bit, 3-channel image with RGB sample order (CV_8UC3).
//! \returns True if the frame has a positive area and the expected type.
bool isValidFrame(const cv::Mat& frame);

//! True if the margins leave a non-empty region inside a frame of the given size.
bool isValidCrop(const cv::Size& frameSize, const CropMargins& margins);

/*! Apply crop margins to a frame.
 * \param [in] frame   RGB frame. Not modified.
 * \param [in] margins Margins to remove. Negative values are treated as zero.
 * \return     Deep copy of the remaining region, or a deep copy of the unmodified frame if the margins are invalid.
 */
cv::Mat cropFrame(const cv::Mat& frame, const CropMargins& margins);

//! Convert an RGB frame to a single channel luminance image. Returns an empty Mat for invalid frames.
cv::Mat toLuminance(const cv::Mat& frame);

} // namespace marksman::vision::core
