#include "vision/core/shotTracker.hpp"

#include <algorithm>
#include <cmath>

namespace marksman::vision::core {

ShotTracker::ShotTracker(TrackerConfig config) : m_config{config} {
}

std::vector<ShotRecord> ShotTracker::update(const DetectionResult& detection, const ScoringConfig& scoring) {
	std::vector<ShotRecord> newShots;

	const auto centerX = static_cast<double>(detection.targetCenter.x);
	const auto centerY = static_cast<double>(detection.targetCenter.y);

	// Holes of this update are not compared against each other.
	const std::size_t priorCount = m_knownHoles.size();

	for (const auto& hole: detection.holes) {
		const cv::Point2f position{hole.x, hole.y};
		if (isKnown(position, priorCount)) {
			continue;
		}

		m_knownHoles.push_back(position);

		const double score      = scoreShot(hole.x, hole.y, centerX, centerY, scoring);
		const double distanceMm = scoring.pixelsPerMm > 0.0 ? std::hypot(hole.x - centerX, hole.y - centerY) / scoring.pixelsPerMm : 0.0;

		const ShotRecord shot{position, hole.radius, score, distanceMm};
		m_shots.push_back(shot);
		m_totalScore += score;
		m_lastShotScore = score;
		newShots.push_back(shot);
	}

	return newShots;
}

void ShotTracker::reset() {
	m_knownHoles.clear();
	m_shots.clear();
	m_totalScore = 0.0;
	m_lastShotScore.reset();
}

void ShotTracker::setConfig(TrackerConfig config) {
	m_config = config;
}

const TrackerConfig& ShotTracker::config() const {
	return m_config;
}

ShotTracker::State ShotTracker::state() const {
	return m_knownHoles.empty() ? State::Empty : State::Accumulating;
}

double ShotTracker::totalScore() const {
	return m_totalScore;
}

std::optional<double> ShotTracker::lastShotScore() const {
	return m_lastShotScore;
}

const std::vector<cv::Point2f>& ShotTracker::knownHoles() const {
	return m_knownHoles;
}

const std::vector<ShotRecord>& ShotTracker::shots() const {
	return m_shots;
}

ScoreSummary ShotTracker::summary() const {
	ScoreSummary summary{};
	summary.total     = m_totalScore;
	summary.shotCount = m_shots.size();
	if (summary.shotCount > 0u) {
		summary.average = m_totalScore / static_cast<double>(summary.shotCount);
	}
	return summary;
}

bool ShotTracker::isKnown(const cv::Point2f& position, const std::size_t priorCount) const {
	const auto end = m_knownHoles.begin() + static_cast<std::ptrdiff_t>(std::min(priorCount, m_knownHoles.size()));
	return std::any_of(m_knownHoles.begin(), end, [&](const cv::Point2f& known) {
		return std::hypot(position.x - known.x, position.y - known.y) < m_config.dedupTolerancePx;
	});
}

} // namespace marksman::vision::core
