#include "vision/core/scoringModel.hpp"

#include <algorithm>
#include <cmath>

namespace marksman::vision::core {

namespace {

//! Ring value just outside the 10 ring edge is 11 - 1 = 10 in the linear law.
static constexpr double LINEAR_ORIGIN = 11.0;

static double roundToTenth(const double value) {
	return std::round(value * 10.0) / 10.0;
}

static double linearScore(const double effectiveMm, const ScoringConfig& config) {
	return LINEAR_ORIGIN - effectiveMm / config.ringWidthMm;
}

static double ringTableScore(const double effectiveMm, const ScoringConfig& config) {
	const auto radii = ringRadiiMm(config);
	for (std::size_t i = 0; i < radii.size(); ++i) {
		if (effectiveMm <= radii[i]) {
			return static_cast<double>(10u - i);
		}
	}
	return MIN_SCORE;
}

} // namespace

double effectiveDistanceMm(const double holeX, const double holeY, const double centerX, const double centerY, const ScoringConfig& config) {
	if (!(config.pixelsPerMm > 0.0) || !std::isfinite(config.pixelsPerMm)) {
		return -1.0;
	}

	const double distPx = std::hypot(holeX - centerX, holeY - centerY);
	const double distMm = distPx / config.pixelsPerMm;
	if (!std::isfinite(distMm)) {
		return -1.0;
	}

	// Touching a ring line counts for the better ring.
	return std::max(0.0, distMm - config.bulletDiameterMm / 2.0);
}

double scoreShot(const double holeX, const double holeY, const double centerX, const double centerY, const ScoringConfig& config) {
	if (!(config.ringWidthMm > 0.0)) {
		return MIN_SCORE;
	}

	const double effectiveMm = effectiveDistanceMm(holeX, holeY, centerX, centerY, config);
	if (effectiveMm < 0.0) {
		return MIN_SCORE;
	}

	const double raw = config.mode == ScoringMode::RingTable ? ringTableScore(effectiveMm, config) : linearScore(effectiveMm, config);
	return roundToTenth(std::clamp(raw, MIN_SCORE, MAX_SCORE));
}

std::array<double, 10> ringRadiiMm(const ScoringConfig& config) {
	std::array<double, 10> radii{};
	for (std::size_t i = 0; i < radii.size(); ++i) {
		radii[i] = config.ring10DiameterMm / 2.0 + static_cast<double>(i) * config.ringWidthMm;
	}
	return radii;
}

} // namespace marksman::vision::core
