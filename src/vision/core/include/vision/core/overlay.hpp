#pragma once

#include "vision/core/holeFinder.hpp"
#include "vision/core/scoringModel.hpp"

#include <opencv2/core/mat.hpp>

namespace marksman::vision::core {

/*! Draw detected holes, the target center and optionally the scoring rings on a copy of the frame.
 * \param [in] frame     RGB frame the detection was made on.
 * \param [in] detection Holes (red) and center (green) to draw.
 * \param [in] config    Calibration used to convert ring radii to pixels.
 * \param [in] showRings Draw rings 10 to 4.
 * \return     RGB image with the overlay. Empty if the frame is not a valid RGB frame.
 */
cv::Mat drawOverlay(const cv::Mat& frame, const DetectionResult& detection, const ScoringConfig& config, bool showRings = true);

} // namespace marksman::vision::core
