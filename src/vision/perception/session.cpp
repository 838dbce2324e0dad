#include "vision/session.hpp"
#include "vision/core/centerResolver.hpp"
#include "vision/core/frame.hpp"

#include <boost/log/trivial.hpp>

namespace marksman::vision {

ScoringSession::ScoringSession(EngineConfig config) : m_config{std::move(config)}, m_tracker{m_config.tracking} {
}

ScoringSession::~ScoringSession() {
	disconnect();
	stop();
}

core::DetectionResult ScoringSession::processFrame(const cv::Mat& frame, core::DebugVisualizer* debugger) {
	const EngineConfig config = this->config();

	if (const std::string problem = validateConfig(config); !problem.empty()) {
		BOOST_LOG_TRIVIAL(warning) << "Skipping frame, invalid configuration: " << problem;
		return {};
	}
	if (!core::isValidFrame(frame)) {
		BOOST_LOG_TRIVIAL(warning) << "Skipping frame, expected a non-empty 8-bit RGB image";
		return {};
	}

	if (!core::isValidCrop(frame.size(), config.crop)) {
		BOOST_LOG_TRIVIAL(debug) << "Crop margins exceed the " << frame.cols << "x" << frame.rows << " frame, using the full frame";
	}
	const cv::Mat cropped = core::cropFrame(frame, config.crop);

	const core::DetectionResult detected = core::findHoles(cropped, config.detection, debugger);
	const core::DetectionResult resolved = core::resolveCenter(detected, config.manualCenter, config.scoring);

	std::vector<core::ShotRecord> newShots;
	{
		std::lock_guard lock(m_mutex);
		newShots        = m_tracker.update(resolved, config.scoring);
		m_lastDetection = resolved;
	}

	BOOST_LOG_TRIVIAL(debug) << "Frame: " << detected.holes.size() << " holes found, " << resolved.holes.size() << " on target, " << newShots.size()
	                         << " new";
	for (const auto& shot: newShots) {
		BOOST_LOG_TRIVIAL(info) << "Shot at (" << shot.position.x << ", " << shot.position.y << ") scored " << shot.score << " ("
		                        << shot.distanceMm << " mm from center)";
	}

	// Callbacks run without holding a lock, they may call back into the session.
	Callbacks callbacks;
	{
		std::lock_guard callbackLock(m_callbackMutex);
		callbacks = m_callbacks;
	}
	if (callbacks.onShotScored) {
		for (const auto& shot: newShots) {
			callbacks.onShotScored(shot);
		}
	}
	if (callbacks.onFrameProcessed) {
		callbacks.onFrameProcessed(resolved);
	}

	return resolved;
}

void ScoringSession::reset() {
	std::lock_guard lock(m_mutex);
	m_tracker.reset();
	BOOST_LOG_TRIVIAL(info) << "Score reset";
}

void ScoringSession::recenter(std::optional<cv::Point2f> center) {
	std::lock_guard lock(m_mutex);
	m_config.manualCenter = center;
	m_tracker.reset();
	m_lastDetection.reset();
	BOOST_LOG_TRIVIAL(info) << "Target re-centered, score reset";
}

void ScoringSession::setConfig(EngineConfig config) {
	std::lock_guard lock(m_mutex);
	m_config = std::move(config);
	m_tracker.setConfig(m_config.tracking);
}

void ScoringSession::setDetectionConfig(const core::DetectionConfig& detection) {
	std::lock_guard lock(m_mutex);
	m_config.detection = detection;
}

void ScoringSession::setScoringConfig(const core::ScoringConfig& scoring) {
	std::lock_guard lock(m_mutex);
	m_config.scoring = scoring;
}

void ScoringSession::setTrackerConfig(const core::TrackerConfig& tracking) {
	std::lock_guard lock(m_mutex);
	m_config.tracking = tracking;
	m_tracker.setConfig(tracking);
}

void ScoringSession::setCropMargins(const core::CropMargins& crop) {
	std::lock_guard lock(m_mutex);
	m_config.crop = crop;
}

void ScoringSession::setManualCenter(std::optional<cv::Point2f> center) {
	std::lock_guard lock(m_mutex);
	m_config.manualCenter = center;
}

EngineConfig ScoringSession::config() const {
	std::lock_guard lock(m_mutex);
	return m_config;
}

std::optional<core::DetectionResult> ScoringSession::lastDetection() const {
	std::lock_guard lock(m_mutex);
	return m_lastDetection;
}

double ScoringSession::totalScore() const {
	std::lock_guard lock(m_mutex);
	return m_tracker.totalScore();
}

std::optional<double> ScoringSession::lastShotScore() const {
	std::lock_guard lock(m_mutex);
	return m_tracker.lastShotScore();
}

std::vector<core::ShotRecord> ScoringSession::shots() const {
	std::lock_guard lock(m_mutex);
	return m_tracker.shots();
}

core::ScoreSummary ScoringSession::summary() const {
	std::lock_guard lock(m_mutex);
	return m_tracker.summary();
}

core::ShotTracker::State ScoringSession::state() const {
	std::lock_guard lock(m_mutex);
	return m_tracker.state();
}

void ScoringSession::connect(Callbacks callbacks) {
	std::lock_guard lock(m_callbackMutex);
	m_callbacks = std::move(callbacks);
}

void ScoringSession::disconnect() {
	std::lock_guard lock(m_callbackMutex);
	m_callbacks = {nullptr, nullptr};
}

void ScoringSession::run(FrameSource& source, const std::chrono::milliseconds idleDelay) {
	if (m_running.load()) {
		return;
	}

	// A loop stopped from its own callback is joined here.
	if (m_sessionThread.joinable()) {
		m_sessionThread.join();
	}

	m_running.store(true);
	m_sessionThread = std::thread([this, &source, idleDelay]() { frameLoop(source, idleDelay); });
}

void ScoringSession::stop() {
	m_running.store(false);

	// Called from a callback on the loop thread: the loop exits after the callback returns.
	if (m_sessionThread.joinable() && m_sessionThread.get_id() != std::this_thread::get_id()) {
		m_sessionThread.join();
	}
}

bool ScoringSession::isRunning() const {
	return m_running.load();
}

void ScoringSession::setFrozen(const bool frozen) {
	m_frozen.store(frozen);
}

bool ScoringSession::isFrozen() const {
	return m_frozen.load();
}

void ScoringSession::frameLoop(FrameSource& source, const std::chrono::milliseconds idleDelay) {
	while (m_running.load()) {
		if (m_frozen.load()) {
			std::this_thread::sleep_for(idleDelay);
			continue;
		}

		std::optional<cv::Mat> frame = source.poll();
		if (!frame) {
			std::this_thread::sleep_for(idleDelay);
			continue;
		}

		processFrame(*frame);
	}
}

} // namespace marksman::vision
