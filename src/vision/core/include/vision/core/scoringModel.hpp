#pragma once

#include <array>

namespace marksman::vision::core {

//! How a distance from the center is turned into a score.
enum class ScoringMode {
	Linear,   //!< Decimal score, 11 - distance / ring width. Approximates uniform ring spacing.
	RingTable //!< Integer ring value from the ring radii of the target.
};

//! Physical target description and camera calibration.
struct ScoringConfig {
	double targetDiameterMm{154.4}; //!< Outer diameter of the scoring area (ring 1).
	double ring10DiameterMm{10.4};  //!< Diameter of the 10 ring.
	double bulletDiameterMm{5.6};   //!< Calibre. Half of it is credited towards the center.
	double pixelsPerMm{10.0};       //!< Image pixels per millimetre on the target plane.
	double ringWidthMm{8.0};        //!< Radial distance between neighbouring rings.
	ScoringMode mode{ScoringMode::Linear};
};

static constexpr double MAX_SCORE = 10.9;
static constexpr double MIN_SCORE = 0.0;

//! Radial distance between hole and center in mm, reduced by the bullet radius and floored at zero.
//! \returns Negative value if the calibration cannot convert pixels to mm.
double effectiveDistanceMm(double holeX, double holeY, double centerX, double centerY, const ScoringConfig& config);

/*! Score a single hole.
 * \param [in] holeX, holeY     Hole centroid in pixels.
 * \param [in] centerX, centerY Target center in pixels.
 * \param [in] config           Target geometry and calibration.
 * \return     Score in [0.0, 10.9] rounded to one decimal. Invalid calibration scores 0.0.
 */
double scoreShot(double holeX, double holeY, double centerX, double centerY, const ScoringConfig& config);

//! Radii in mm of rings 10 down to 1 (index 0 is the 10 ring).
std::array<double, 10> ringRadiiMm(const ScoringConfig& config);

} // namespace marksman::vision::core
