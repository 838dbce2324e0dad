#pragma once

#include "vision/core/debugVisualizer.hpp"

#include <opencv2/core/mat.hpp>
#include <opencv2/core/types.hpp>

#include <vector>

namespace marksman::vision::core {

//! A detected bullet hole in frame coordinates.
struct Hole {
	float x;      //!< Centroid x in pixels.
	float y;      //!< Centroid y in pixels.
	float radius; //!< Equal-area disk radius in pixels.
};

//! Result of the hole detection stage for a single frame.
struct DetectionResult {
	bool success{false};         //!< False if the frame was rejected before detection (empty or wrong type). Not a visibility signal.
	cv::Point targetCenter{};    //!< Active target center in pixels. Defaults to the frame center.
	std::vector<Hole> holes{};   //!< Accepted holes in contour order.
};

//! Shape measurements of one contour.
struct HoleCandidate {
	float x{0.0f};
	float y{0.0f};
	float radius{0.0f};
	double area{0.0};
	double perimeter{0.0};
	double circularity{0.0};
	bool valid{false}; //!< False for degenerate contours (no points or zero perimeter).
};

//! Threshold and shape filter parameters.
struct DetectionConfig {
	int thresholdValue{100};    //!< Pixels with luminance strictly below this are foreground (0-255).
	float minHoleRadius{2.0f};  //!< Smallest accepted radius in pixels.
	float maxHoleRadius{20.0f}; //!< Largest accepted radius in pixels.
	float minCircularity{0.6f}; //!< 4*pi*area/perimeter^2 must reach this (0-1).
	int minContourPoints{10};   //!< Contours need strictly more points than this.
	int maxContourPoints{500};  //!< Contours need strictly fewer points than this.
};

/*! Measure area, perimeter, circularity, vertex centroid and equal-area radius of a closed contour.
 * \param [in] contour Closed boundary trace.
 * \return     HoleCandidate. `valid` is false if the perimeter is zero.
 */
HoleCandidate measureContour(const std::vector<cv::Point>& contour);

/*! Detect dark, near circular holes in an RGB frame.
 * \param [in]     frame    RGB frame (CV_8UC3). Not modified.
 * \param [in]     config   Threshold and shape filter parameters.
 * \param [in,out] debugger Optional debug visualizer for intermediate images.
 * \return         DetectionResult with the frame center as target center. No holes is a normal result.
 */
DetectionResult findHoles(const cv::Mat& frame, const DetectionConfig& config = DetectionConfig{}, DebugVisualizer* debugger = nullptr);

} // namespace marksman::vision::core
