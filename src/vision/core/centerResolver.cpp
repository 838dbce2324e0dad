#include "vision/core/centerResolver.hpp"

#include <algorithm>
#include <cmath>
#include <limits>

namespace marksman::vision::core {

namespace {

static bool fitsInt(const float value) {
	const auto v = static_cast<double>(value);
	return std::isfinite(v) && v > static_cast<double>(std::numeric_limits<int>::min()) - 1.0 && v < static_cast<double>(std::numeric_limits<int>::max()) + 1.0;
}

} // namespace

bool isUsableCenter(const cv::Point2f& center) {
	return fitsInt(center.x) && fitsInt(center.y);
}

double gatingRadiusPx(const ScoringConfig& config) {
	return (config.targetDiameterMm / 2.0 * GATING_MARGIN) * config.pixelsPerMm;
}

DetectionResult resolveCenter(const DetectionResult& detection, const std::optional<cv::Point2f>& manualCenter, const ScoringConfig& config) {
	DetectionResult resolved = detection;

	double centerX = static_cast<double>(detection.targetCenter.x);
	double centerY = static_cast<double>(detection.targetCenter.y);
	if (manualCenter && isUsableCenter(*manualCenter)) {
		centerX               = static_cast<double>(manualCenter->x);
		centerY               = static_cast<double>(manualCenter->y);
		resolved.targetCenter = cv::Point(static_cast<int>(manualCenter->x), static_cast<int>(manualCenter->y));
	}

	const double maxRadiusPx = gatingRadiusPx(config);
	const auto outside       = [&](const Hole& hole) {
		const double dist = std::hypot(static_cast<double>(hole.x) - centerX, static_cast<double>(hole.y) - centerY);
		return !(dist <= maxRadiusPx);
	};
	resolved.holes.erase(std::remove_if(resolved.holes.begin(), resolved.holes.end(), outside), resolved.holes.end());

	return resolved;
}

} // namespace marksman::vision::core
