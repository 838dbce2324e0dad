#include "vision/session.hpp"

#include <gtest/gtest.h>
#include <opencv2/imgproc.hpp>

#include <atomic>
#include <chrono>
#include <limits>
#include <thread>

namespace marksman::vision {
namespace gtest {

static cv::Mat makePaper(int width = 640, int height = 480) {
	return cv::Mat(height, width, CV_8UC3, cv::Scalar(255, 255, 255));
}

static void drawHole(cv::Mat& frame, cv::Point center, int radius = 8) {
	cv::circle(frame, center, radius, cv::Scalar(0, 0, 0), cv::FILLED, cv::LINE_8);
}

//! Poll `condition` until it holds or the timeout expires.
template <typename Condition>
static bool waitFor(Condition condition, std::chrono::milliseconds timeout = std::chrono::milliseconds(5000)) {
	const auto deadline = std::chrono::steady_clock::now() + timeout;
	while (std::chrono::steady_clock::now() < deadline) {
		if (condition()) {
			return true;
		}
		std::this_thread::sleep_for(std::chrono::milliseconds(2));
	}
	return condition();
}

TEST(ScoringSessionUnit, EmptyTarget) {
	ScoringSession session;
	const auto detection = session.processFrame(makePaper());
	EXPECT_TRUE(detection.success);
	EXPECT_TRUE(detection.holes.empty());
	EXPECT_EQ(session.state(), core::ShotTracker::State::Empty);
	EXPECT_DOUBLE_EQ(session.totalScore(), 0.0);
	EXPECT_FALSE(session.lastShotScore().has_value());
}

TEST(ScoringSessionUnit, RepeatedFrames_ScoredOnce) {
	ScoringSession session;
	cv::Mat frame = makePaper();
	drawHole(frame, {100, 100}, 12);

	const auto detection = session.processFrame(frame);
	ASSERT_TRUE(detection.success);
	EXPECT_EQ(detection.targetCenter, cv::Point(320, 240));
	ASSERT_EQ(detection.holes.size(), 1u);

	// 260.8 px at 10 px/mm with a 5.6 mm bullet.
	ASSERT_TRUE(session.lastShotScore().has_value());
	EXPECT_NEAR(*session.lastShotScore(), 8.1, 1e-9);
	const double total = session.totalScore();
	EXPECT_GT(total, 0.0);

	for (int i = 0; i < 5; ++i) {
		session.processFrame(frame);
	}
	EXPECT_DOUBLE_EQ(session.totalScore(), total);
	EXPECT_EQ(session.shots().size(), 1u);
	EXPECT_EQ(session.summary().shotCount, 1u);
}

TEST(ScoringSessionUnit, SecondShotAdded) {
	ScoringSession session;
	cv::Mat frame = makePaper();
	drawHole(frame, {100, 100});
	session.processFrame(frame);

	drawHole(frame, {400, 300});
	session.processFrame(frame);

	ASSERT_EQ(session.shots().size(), 2u);
	EXPECT_NEAR(session.shots()[1].position.x, 400.0f, 0.5f);
	EXPECT_DOUBLE_EQ(session.totalScore(), session.shots()[0].score + session.shots()[1].score);
}

TEST(ScoringSessionUnit, CropShiftsCoordinates) {
	EngineConfig config{};
	config.crop = {50, 0, 30, 0};
	ScoringSession session{config};

	cv::Mat frame = makePaper();
	drawHole(frame, {150, 130});

	const auto detection = session.processFrame(frame);
	ASSERT_EQ(detection.holes.size(), 1u);
	EXPECT_NEAR(detection.holes[0].x, 100.0f, 0.5f);
	EXPECT_NEAR(detection.holes[0].y, 100.0f, 0.5f);
	EXPECT_EQ(detection.targetCenter, cv::Point(295, 225));
}

TEST(ScoringSessionUnit, InvalidCrop_UsesFullFrame) {
	ScoringSession session;
	session.setCropMargins({400, 400, 0, 0});

	cv::Mat frame = makePaper();
	drawHole(frame, {150, 130});

	const auto detection = session.processFrame(frame);
	ASSERT_TRUE(detection.success);
	ASSERT_EQ(detection.holes.size(), 1u);
	EXPECT_NEAR(detection.holes[0].x, 150.0f, 0.5f);
	EXPECT_EQ(detection.targetCenter, cv::Point(320, 240));
}

TEST(ScoringSessionUnit, ManualCenter_GatesAndScores) {
	EngineConfig config{};
	config.scoring.pixelsPerMm      = 1.0;
	config.scoring.targetDiameterMm = 100.0;
	config.manualCenter             = cv::Point2f(100.0f, 100.0f);
	ScoringSession session{config};

	cv::Mat frame = makePaper();
	drawHole(frame, {100, 100});
	drawHole(frame, {300, 300});

	const auto detection = session.processFrame(frame);
	EXPECT_EQ(detection.targetCenter, cv::Point(100, 100));
	ASSERT_EQ(detection.holes.size(), 1u);
	ASSERT_TRUE(session.lastShotScore().has_value());
	EXPECT_DOUBLE_EQ(*session.lastShotScore(), 10.9);

	// Clearing the center falls back to the frame center.
	session.setManualCenter(std::nullopt);
	EXPECT_EQ(session.processFrame(frame).targetCenter, cv::Point(320, 240));
}

TEST(ScoringSessionUnit, InvalidFrame_Skipped) {
	ScoringSession session;
	EXPECT_FALSE(session.processFrame(cv::Mat{}).success);
	EXPECT_FALSE(session.processFrame(cv::Mat(480, 640, CV_8UC1, cv::Scalar(0))).success);
	EXPECT_FALSE(session.lastDetection().has_value());
	EXPECT_EQ(session.state(), core::ShotTracker::State::Empty);
}

TEST(ScoringSessionUnit, InvalidConfig_Skipped) {
	cv::Mat frame = makePaper();
	drawHole(frame, {100, 100});

	ScoringSession session;
	core::ScoringConfig scoring{};
	scoring.pixelsPerMm = 0.0;
	session.setScoringConfig(scoring);

	EXPECT_FALSE(session.processFrame(frame).success);
	EXPECT_TRUE(session.shots().empty());

	session.setScoringConfig(core::ScoringConfig{});
	EXPECT_TRUE(session.processFrame(frame).success);
	EXPECT_EQ(session.shots().size(), 1u);
}

TEST(ScoringSessionUnit, DetectionConfig_TakesEffectNextFrame) {
	cv::Mat frame = makePaper();
	drawHole(frame, {100, 100});

	ScoringSession session;
	core::DetectionConfig detection{};
	detection.thresholdValue = 0;
	session.setDetectionConfig(detection);
	EXPECT_TRUE(session.processFrame(frame).holes.empty());

	session.setDetectionConfig(core::DetectionConfig{});
	EXPECT_EQ(session.processFrame(frame).holes.size(), 1u);
	EXPECT_EQ(session.config().detection.thresholdValue, 100);
}

TEST(ScoringSessionUnit, Reset) {
	cv::Mat frame = makePaper();
	drawHole(frame, {100, 100});

	ScoringSession session;
	session.processFrame(frame);
	const double total = session.totalScore();

	session.reset();
	EXPECT_EQ(session.state(), core::ShotTracker::State::Empty);
	EXPECT_DOUBLE_EQ(session.totalScore(), 0.0);
	EXPECT_FALSE(session.lastShotScore().has_value());

	session.processFrame(frame);
	EXPECT_DOUBLE_EQ(session.totalScore(), total);
}

TEST(ScoringSessionUnit, Callbacks) {
	cv::Mat frame = makePaper();
	drawHole(frame, {100, 100});
	drawHole(frame, {200, 300});

	int shotCount  = 0;
	int frameCount = 0;

	ScoringSession session;
	session.connect({[&shotCount](const core::ShotRecord&) { ++shotCount; }, [&frameCount](const core::DetectionResult&) { ++frameCount; }});

	session.processFrame(frame);
	session.processFrame(frame);
	EXPECT_EQ(shotCount, 2);
	EXPECT_EQ(frameCount, 2);

	session.disconnect();
	session.reset();
	session.processFrame(frame);
	EXPECT_EQ(shotCount, 2);
	EXPECT_EQ(frameCount, 2);
}

TEST(ScoringSessionUnit, CallbackMayDisconnect) {
	cv::Mat frame = makePaper();
	drawHole(frame, {100, 100});
	drawHole(frame, {200, 300});

	int shotCount = 0;
	ScoringSession session;
	session.connect({[&](const core::ShotRecord&) {
		                 ++shotCount;
		                 session.disconnect();
	                 },
	                 nullptr});

	// Both shots of the frame are still delivered, the next frame has no listener.
	session.processFrame(frame);
	EXPECT_EQ(shotCount, 2);

	session.reset();
	session.processFrame(frame);
	EXPECT_EQ(shotCount, 2);
}

TEST(ScoringSessionUnit, CallbackMayQuerySession) {
	cv::Mat frame = makePaper();
	drawHole(frame, {100, 100});

	double seenTotal = -1.0;
	ScoringSession session;
	session.connect({[&](const core::ShotRecord&) { seenTotal = session.totalScore(); }, nullptr});

	session.processFrame(frame);
	EXPECT_DOUBLE_EQ(seenTotal, session.totalScore());
}

TEST(ScoringSessionUnit, CallbackMayStopLoop) {
	cv::Mat frame = makePaper();
	drawHole(frame, {100, 100});
	ImageSource source{frame};

	std::atomic<int> frames{0};
	ScoringSession session;
	session.connect({nullptr, [&](const core::DetectionResult&) {
		                 ++frames;
		                 session.stop();
	                 }});

	session.run(source, std::chrono::milliseconds(1));
	ASSERT_TRUE(waitFor([&]() { return frames.load() == 1 && !session.isRunning(); }));

	// Restarting joins the finished loop thread.
	source.requestReprocess();
	session.run(source, std::chrono::milliseconds(1));
	ASSERT_TRUE(waitFor([&]() { return frames.load() == 2; }));
	session.stop();
}

TEST(ScoringSessionUnit, Recenter_RestartsScore) {
	cv::Mat frame = makePaper();
	drawHole(frame, {100, 100});

	ScoringSession session;
	session.processFrame(frame);
	ASSERT_EQ(session.shots().size(), 1u);
	const double fromFrameCenter = session.totalScore();
	EXPECT_NEAR(fromFrameCenter, 8.1, 1e-9);

	session.recenter(cv::Point2f(100.0f, 100.0f));
	EXPECT_EQ(session.state(), core::ShotTracker::State::Empty);
	EXPECT_DOUBLE_EQ(session.totalScore(), 0.0);
	EXPECT_FALSE(session.lastDetection().has_value());
	ASSERT_TRUE(session.config().manualCenter.has_value());

	// The same hole is scored again, now against the new center.
	session.processFrame(frame);
	ASSERT_EQ(session.shots().size(), 1u);
	EXPECT_DOUBLE_EQ(session.totalScore(), 10.9);

	session.recenter(std::nullopt);
	EXPECT_FALSE(session.config().manualCenter.has_value());
	session.processFrame(frame);
	EXPECT_NEAR(session.totalScore(), fromFrameCenter, 1e-9);
}

TEST(ScoringSessionUnit, SetManualCenter_KeepsShots) {
	cv::Mat frame = makePaper();
	drawHole(frame, {100, 100});

	ScoringSession session;
	session.processFrame(frame);
	const double total = session.totalScore();

	session.setManualCenter(cv::Point2f(100.0f, 100.0f));
	session.processFrame(frame);
	EXPECT_DOUBLE_EQ(session.totalScore(), total);
	EXPECT_EQ(session.shots().size(), 1u);
}

TEST(ScoringSessionUnit, UnusableManualCenter_FrameSkipped) {
	cv::Mat frame = makePaper();
	drawHole(frame, {100, 100});

	ScoringSession session;
	session.setManualCenter(cv::Point2f(std::numeric_limits<float>::quiet_NaN(), 0.0f));
	EXPECT_FALSE(session.processFrame(frame).success);
	EXPECT_TRUE(session.shots().empty());

	session.setManualCenter(cv::Point2f(1e20f, 0.0f));
	EXPECT_FALSE(session.processFrame(frame).success);
	EXPECT_TRUE(session.shots().empty());
}

TEST(ScoringSessionUnit, RunLoop_ProcessesImageSource) {
	cv::Mat frame = makePaper();
	drawHole(frame, {100, 100});
	ImageSource source{frame};

	std::atomic<int> frames{0};
	ScoringSession session;
	session.connect({nullptr, [&frames](const core::DetectionResult&) { ++frames; }});

	session.run(source, std::chrono::milliseconds(1));
	EXPECT_TRUE(session.isRunning());
	ASSERT_TRUE(waitFor([&]() { return frames.load() >= 1; }));

	// A static image is processed once until reprocessing is requested.
	std::this_thread::sleep_for(std::chrono::milliseconds(20));
	EXPECT_EQ(frames.load(), 1);

	source.requestReprocess();
	ASSERT_TRUE(waitFor([&]() { return frames.load() >= 2; }));

	session.stop();
	EXPECT_FALSE(session.isRunning());
	EXPECT_EQ(session.shots().size(), 1u);
}

TEST(ScoringSessionUnit, Frozen_StopsPulling) {
	ImageSource source{makePaper()};

	std::atomic<int> frames{0};
	ScoringSession session;
	session.connect({nullptr, [&frames](const core::DetectionResult&) { ++frames; }});
	session.setFrozen(true);
	EXPECT_TRUE(session.isFrozen());

	session.run(source, std::chrono::milliseconds(1));
	std::this_thread::sleep_for(std::chrono::milliseconds(30));
	EXPECT_EQ(frames.load(), 0);

	session.setFrozen(false);
	EXPECT_TRUE(waitFor([&]() { return frames.load() == 1; }));
	session.stop();
}

} // namespace gtest
} // namespace marksman::vision
