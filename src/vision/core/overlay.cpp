#include "vision/core/overlay.hpp"
#include "vision/core/frame.hpp"

#include <algorithm>
#include <cmath>
#include <cstddef>

#include <opencv2/imgproc.hpp>

namespace marksman::vision::core {

namespace {

//! Rings 10 down to 4 fit on a typical photo of the black.
static constexpr std::size_t DRAWN_RINGS = 7u;

// RGB order.
static const cv::Scalar HOLE_COLOUR(255, 0, 0);
static const cv::Scalar CENTER_COLOUR(0, 255, 0);
static const cv::Scalar RING_COLOUR(0, 160, 0);

} // namespace

cv::Mat drawOverlay(const cv::Mat& frame, const DetectionResult& detection, const ScoringConfig& config, const bool showRings) {
	if (!isValidFrame(frame)) {
		return {};
	}

	cv::Mat out = frame.clone();

	for (const auto& hole: detection.holes) {
		const cv::Point center(static_cast<int>(std::lround(hole.x)), static_cast<int>(std::lround(hole.y)));
		cv::circle(out, center, std::max(1, static_cast<int>(std::lround(hole.radius))), HOLE_COLOUR, 2, cv::LINE_AA);
	}

	if (showRings && config.pixelsPerMm > 0.0) {
		const auto radii = ringRadiiMm(config);
		for (std::size_t i = 0; i < DRAWN_RINGS; ++i) {
			const int radiusPx = static_cast<int>(std::lround(radii[i] * config.pixelsPerMm));
			cv::circle(out, detection.targetCenter, radiusPx, RING_COLOUR, 1, cv::LINE_AA);
		}
	}

	cv::circle(out, detection.targetCenter, 5, CENTER_COLOUR, cv::FILLED, cv::LINE_AA);
	return out;
}

} // namespace marksman::vision::core
