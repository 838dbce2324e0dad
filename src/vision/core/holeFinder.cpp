#include "vision/core/holeFinder.hpp"
#include "vision/core/frame.hpp"

#include <cmath>
#include <numbers>
#include <string>

#include <opencv2/imgproc.hpp>

namespace marksman::vision::core {

namespace {

//! Binary mask where luminance < threshold is 255 (hole) and everything else 0 (paper).
static cv::Mat thresholdHoles(const cv::Mat& gray, const int thresholdValue) {
	cv::Mat binary;
	cv::compare(gray, cv::Scalar(thresholdValue), binary, cv::CMP_LT);
	return binary;
}

//! Contour point count must lie strictly between the configured limits.
static bool hasPlausibleLength(const std::vector<cv::Point>& contour, const DetectionConfig& config) {
	const auto count = static_cast<int>(contour.size());
	return count > config.minContourPoints && count < config.maxContourPoints;
}

static bool isAccepted(const HoleCandidate& candidate, const DetectionConfig& config) {
	if (!candidate.valid) {
		return false;
	}
	if (candidate.circularity < static_cast<double>(config.minCircularity)) {
		return false;
	}
	return candidate.radius >= config.minHoleRadius && candidate.radius <= config.maxHoleRadius;
}

} // namespace

HoleCandidate measureContour(const std::vector<cv::Point>& contour) {
	HoleCandidate candidate{};
	if (contour.empty()) {
		return candidate;
	}

	// Shoelace area and closed polygon length.
	candidate.area      = cv::contourArea(contour, false);
	candidate.perimeter = cv::arcLength(contour, true);
	if (!(candidate.perimeter > 0.0)) {
		return candidate;
	}

	candidate.circularity = 4.0 * std::numbers::pi * candidate.area / (candidate.perimeter * candidate.perimeter);

	// Vertex mean, not the area centroid.
	double sumX = 0.0;
	double sumY = 0.0;
	for (const auto& p: contour) {
		sumX += p.x;
		sumY += p.y;
	}
	const auto count = static_cast<double>(contour.size());
	candidate.x      = static_cast<float>(sumX / count);
	candidate.y      = static_cast<float>(sumY / count);
	candidate.radius = static_cast<float>(std::sqrt(candidate.area / std::numbers::pi));
	candidate.valid  = true;
	return candidate;
}

DetectionResult findHoles(const cv::Mat& frame, const DetectionConfig& config, DebugVisualizer* debugger) {
	DetectionResult result{};
	if (!isValidFrame(frame)) {
		return result;
	}

	result.success      = true;
	result.targetCenter = cv::Point(frame.cols / 2, frame.rows / 2);

	const cv::Mat gray   = toLuminance(frame);
	const cv::Mat binary = thresholdHoles(gray, config.thresholdValue);

	std::vector<std::vector<cv::Point>> contours;
	cv::findContours(binary, contours, cv::RETR_LIST, cv::CHAIN_APPROX_NONE);

	std::vector<std::vector<cv::Point>> accepted;
	for (const auto& contour: contours) {
		if (!hasPlausibleLength(contour, config)) {
			continue;
		}

		const HoleCandidate candidate = measureContour(contour);
		if (!isAccepted(candidate, config)) {
			continue;
		}

		result.holes.push_back(Hole{candidate.x, candidate.y, candidate.radius});
		if (debugger) {
			accepted.push_back(contour);
		}
	}

	if (debugger) {
		cv::Mat overlay;
		cv::cvtColor(frame, overlay, cv::COLOR_RGB2BGR);
		cv::drawContours(overlay, accepted, -1, cv::Scalar(0, 0, 255), 2);
		cv::circle(overlay, result.targetCenter, 5, cv::Scalar(0, 255, 0), cv::FILLED);

		debugger->beginStage("Find Holes");
		debugger->add("Luminance", gray);
		debugger->add("Threshold", binary);
		debugger->add("Accepted (" + std::to_string(result.holes.size()) + ")", overlay);
		debugger->endStage();
	}

	return result;
}

} // namespace marksman::vision::core
