#pragma once

#include <opencv2/core/mat.hpp>

#include <cstddef>
#include <string>
#include <vector>

namespace marksman::vision::core {

//! One intermediate image of a detection step.
struct DebugStep {
	std::string name; //!< Label drawn above the tile.
	cv::Mat image;    //!< Deep copy of the image (any depth, 1, 3 or 4 channels, BGR order).
};

//! A named group of steps, e.g. everything produced while finding holes in one frame.
struct DebugStage {
	std::string name;
	std::vector<DebugStep> steps{};
};

//! Collects intermediate images of the detection pipeline and lays them out as one mosaic image.
//! Pass a pointer to the detection functions to enable it. Costs nothing when not passed.
class DebugVisualizer {
public:
	void beginStage(std::string name);              //!< Start a new stage. Ends the active one.
	void add(std::string name, const cv::Mat& img); //!< Add a step to the active stage. Ignored without an active stage.
	void endStage();

	//! One row per stage, one tile per step. Ends the active stage.
	//! \returns Empty Mat if nothing was collected.
	cv::Mat buildMosaic();

	std::size_t stageCount() const;
	void clear();

private:
	static cv::Mat toBgr8U(const cv::Mat& in);

private:
	DebugStage m_currentStage{};
	bool m_hasActiveStage{false};
	std::vector<DebugStage> m_stages{};
};

} // namespace marksman::vision::core
