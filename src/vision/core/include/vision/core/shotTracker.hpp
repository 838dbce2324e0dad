#pragma once

#include "vision/core/holeFinder.hpp"
#include "vision/core/scoringModel.hpp"

#include <opencv2/core/types.hpp>

#include <cstddef>
#include <optional>
#include <vector>

namespace marksman::vision::core {

//! A hole confirmed as a new shot, with the score it got at that moment.
struct ShotRecord {
	cv::Point2f position; //!< Hole centroid in pixels.
	float radius;         //!< Hole radius in pixels.
	double score;         //!< Score at confirmation. Never recomputed.
	double distanceMm;    //!< Center distance in mm at confirmation (0 if the calibration was invalid).
};

struct ScoreSummary {
	double total{0.0};
	std::size_t shotCount{0u};
	double average{0.0}; //!< 0 without shots.
};

struct TrackerConfig {
	double dedupTolerancePx{10.0}; //!< Holes closer than this to a known hole are the same hole. Raw pixels, tune with pixelsPerMm.
};

/*! Remembers every hole seen on the current target and scores the ones that are new.
 *  Holes are compared only against holes of previous updates. Two new holes of the same update that are closer than
 *  the tolerance are both recorded.
 *  \note Not thread safe. One owner per target session.
 */
class ShotTracker {
public:
	enum class State { Empty, Accumulating };

public:
	explicit ShotTracker(TrackerConfig config = TrackerConfig{});

	//! Record and score the holes of a detection that are not known yet.
	//! \returns The new shots in detection order. Empty if nothing changed.
	std::vector<ShotRecord> update(const DetectionResult& detection, const ScoringConfig& scoring);

	void reset(); //!< Forget all holes and scores.

	void setConfig(TrackerConfig config);
	const TrackerConfig& config() const;

	State state() const;
	double totalScore() const;
	std::optional<double> lastShotScore() const;
	const std::vector<cv::Point2f>& knownHoles() const;
	const std::vector<ShotRecord>& shots() const;
	ScoreSummary summary() const;

private:
	bool isKnown(const cv::Point2f& position, std::size_t priorCount) const; //!< Compare against the first priorCount known holes.

private:
	TrackerConfig m_config;

	std::vector<cv::Point2f> m_knownHoles{}; //!< Append only until reset.
	std::vector<ShotRecord> m_shots{};       //!< Confirmed shots in confirmation order.
	double m_totalScore{0.0};
	std::optional<double> m_lastShotScore{};
};

} // namespace marksman::vision::core
