#pragma once

#include "vision/config.hpp"
#include "vision/core/debugVisualizer.hpp"
#include "vision/core/holeFinder.hpp"
#include "vision/core/shotTracker.hpp"
#include "vision/source.hpp"

#include <atomic>
#include <chrono>
#include <functional>
#include <memory>
#include <mutex>
#include <optional>
#include <thread>
#include <vector>

namespace marksman::vision {

/*! Scores one paper target over a sequence of frames.
 *  Process per frame:
 *   - Crop the frame by the configured margins (unmodified frame if the margins are invalid).
 *   - Find holes, resolve the target center, gate holes outside the target.
 *   - Record and score holes that were not seen before.
 *  The caller either pushes frames through processFrame() or attaches a FrameSource and calls run().
 *  All public functions may be called from any thread.
 */
class ScoringSession {
public:
	struct Callbacks {
		std::function<void(const core::ShotRecord&)> onShotScored;           //!< A new hole was scored.
		std::function<void(const core::DetectionResult&)> onFrameProcessed; //!< A frame went through the pipeline.
	};

public:
	explicit ScoringSession(EngineConfig config = EngineConfig{});
	~ScoringSession();

	/*! Run the full pipeline on one frame.
	 * \param [in]     frame    RGB frame (CV_8UC3). Not modified.
	 * \param [in,out] debugger Optional debug visualizer for intermediate images.
	 * \return         Detection after center resolution and gating. `success` is false if the frame or the configuration was rejected.
	 */
	core::DetectionResult processFrame(const cv::Mat& frame, core::DebugVisualizer* debugger = nullptr);

	void reset(); //!< Clear all holes and scores.

	//! Move the target center and start a new score. std::nullopt returns to the detected center.
	//! Shots scored against the previous center are discarded.
	void recenter(std::optional<cv::Point2f> center);

	// Configuration. Takes effect on the next frame.
	void setConfig(EngineConfig config);
	void setDetectionConfig(const core::DetectionConfig& detection);
	void setScoringConfig(const core::ScoringConfig& scoring);
	void setTrackerConfig(const core::TrackerConfig& tracking);
	void setCropMargins(const core::CropMargins& crop);
	void setManualCenter(std::optional<cv::Point2f> center); //!< Keeps recorded shots. See recenter().
	EngineConfig config() const;

	// Results for the UI.
	std::optional<core::DetectionResult> lastDetection() const;
	double totalScore() const;
	std::optional<double> lastShotScore() const;
	std::vector<core::ShotRecord> shots() const;
	core::ScoreSummary summary() const;
	core::ShotTracker::State state() const;

	void connect(Callbacks callbacks); //!< Connect callback functions. Called on the processing thread without internal locks held.
	void disconnect();                 //!< Disconnect the callback functions.

	//! Start pulling frames from the source on a background thread.
	//! \note The session does not own the source. It must outlive stop().
	void run(FrameSource& source, std::chrono::milliseconds idleDelay = std::chrono::milliseconds(10));
	void stop(); //!< May be called from a callback. The loop thread is then joined by the next run() or the destructor.
	bool isRunning() const;

	void setFrozen(bool frozen); //!< Stop pulling frames without stopping the loop (snapshot).
	bool isFrozen() const;

private:
	void frameLoop(FrameSource& source, std::chrono::milliseconds idleDelay);

private:
	mutable std::mutex m_mutex;                            //!< Guards config, tracker and last detection.
	EngineConfig m_config;                                 //!< Configuration used for the next frame.
	core::ShotTracker m_tracker;                           //!< Holes and scores of the current target.
	std::optional<core::DetectionResult> m_lastDetection{}; //!< Last successfully processed frame.

	std::mutex m_callbackMutex;
	Callbacks m_callbacks{};

	std::atomic<bool> m_running{false};
	std::atomic<bool> m_frozen{false};
	std::thread m_sessionThread{};
};

} // namespace marksman::vision
