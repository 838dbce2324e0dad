#pragma once

#include "vision/core/holeFinder.hpp"
#include "vision/core/scoringModel.hpp"

#include <opencv2/core/types.hpp>

#include <optional>

namespace marksman::vision::core {

//! Safety factor applied to the physical target radius when gating holes.
static constexpr double GATING_MARGIN = 1.5;

//! True if both coordinates are finite and can be truncated to int pixels.
bool isUsableCenter(const cv::Point2f& center);

//! Largest plausible hole distance from the target center in pixels.
double gatingRadiusPx(const ScoringConfig& config);

/*! Select the active target center and drop holes that cannot lie on the target.
 * \param [in] detection    Result of findHoles.
 * \param [in] manualCenter Optional user supplied center. Stored truncated to pixels, gating uses the float value.
 *                          Ignored if it is not a usable center (see isUsableCenter).
 * \param [in] config       Target geometry and calibration for the gating radius.
 * \return     Copy of the detection with the resolved center and the gated holes (order preserved).
 */
DetectionResult resolveCenter(const DetectionResult& detection, const std::optional<cv::Point2f>& manualCenter, const ScoringConfig& config);

} // namespace marksman::vision::core
