#include "vision/core/frame.hpp"

#include <algorithm>

#include <opencv2/imgproc.hpp>

namespace marksman::vision::core {

bool isValidFrame(const cv::Mat& frame) {
	return !frame.empty() && frame.cols > 0 && frame.rows > 0 && frame.type() == CV_8UC3;
}

bool isValidCrop(const cv::Size& frameSize, const CropMargins& margins) {
	const int left   = std::max(0, margins.left);
	const int right  = std::max(0, margins.right);
	const int top    = std::max(0, margins.top);
	const int bottom = std::max(0, margins.bottom);

	return frameSize.width > 0 && frameSize.height > 0 && left + right < frameSize.width && top + bottom < frameSize.height;
}

cv::Mat cropFrame(const cv::Mat& frame, const CropMargins& margins) {
	if (frame.empty() || !isValidCrop(frame.size(), margins)) {
		return frame.clone();
	}

	const int left   = std::max(0, margins.left);
	const int right  = std::max(0, margins.right);
	const int top    = std::max(0, margins.top);
	const int bottom = std::max(0, margins.bottom);

	const cv::Rect roi(left, top, frame.cols - left - right, frame.rows - top - bottom);
	return frame(roi).clone();
}

cv::Mat toLuminance(const cv::Mat& frame) {
	if (!isValidFrame(frame)) {
		return {};
	}

	cv::Mat gray;
	cv::cvtColor(frame, gray, cv::COLOR_RGB2GRAY);
	return gray;
}

} // namespace marksman::vision::core
