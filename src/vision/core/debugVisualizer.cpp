#include "vision/core/debugVisualizer.hpp"

#include <algorithm>
#include <cmath>

#include <opencv2/imgproc.hpp>

namespace marksman::vision::core {

void DebugVisualizer::beginStage(std::string name) {
	if (m_hasActiveStage) {
		endStage();
	}
	m_hasActiveStage    = true;
	m_currentStage.name = std::move(name);
}

void DebugVisualizer::endStage() {
	if (!m_hasActiveStage) {
		return;
	}

	m_stages.emplace_back(std::move(m_currentStage));
	m_currentStage   = DebugStage{};
	m_hasActiveStage = false;
}

void DebugVisualizer::add(std::string name, const cv::Mat& img) {
	if (!m_hasActiveStage) {
		return;
	}
	m_currentStage.steps.push_back(DebugStep{std::move(name), img.clone()});
}

std::size_t DebugVisualizer::stageCount() const {
	return m_stages.size() + (m_hasActiveStage ? 1u : 0u);
}

void DebugVisualizer::clear() {
	m_stages.clear();
	m_currentStage   = DebugStage{};
	m_hasActiveStage = false;
}

cv::Mat DebugVisualizer::buildMosaic() {
	static constexpr int TILE_W        = 320;
	static constexpr int TILE_H        = 240;
	static constexpr int LABEL_H       = 24;
	static constexpr int STAGE_LABEL_W = 140;
	static constexpr int PAD           = 4;

	static const cv::Scalar BG(20, 20, 20);
	static const cv::Scalar FG(255, 255, 255);

	if (m_hasActiveStage) {
		endStage();
	}

	std::size_t maxSteps = 0;
	for (const auto& stage: m_stages) {
		maxSteps = std::max(maxSteps, stage.steps.size());
	}
	if (maxSteps == 0) {
		return {};
	}

	const int rowH    = LABEL_H + TILE_H;
	const int mosaicW = STAGE_LABEL_W + static_cast<int>(maxSteps) * TILE_W;
	const int mosaicH = static_cast<int>(m_stages.size()) * rowH;
	cv::Mat mosaic(mosaicH, mosaicW, CV_8UC3, BG);

	for (std::size_t r = 0; r < m_stages.size(); ++r) {
		const auto& stage = m_stages[r];
		const int y       = static_cast<int>(r) * rowH;

		const std::string stageName = stage.name.empty() ? "Stage " + std::to_string(r + 1) : stage.name;
		cv::putText(mosaic, stageName, cv::Point(PAD, y + LABEL_H + TILE_H / 2), cv::FONT_HERSHEY_SIMPLEX, 0.5, FG, 1, cv::LINE_AA);

		for (std::size_t c = 0; c < stage.steps.size(); ++c) {
			const auto& step = stage.steps[c];
			const int x      = STAGE_LABEL_W + static_cast<int>(c) * TILE_W;

			cv::putText(mosaic, step.name, cv::Point(x + PAD, y + LABEL_H - 7), cv::FONT_HERSHEY_SIMPLEX, 0.5, FG, 1, cv::LINE_AA);
			if (step.image.empty()) {
				continue;
			}

			// Fit into the tile keeping the aspect ratio.
			const cv::Mat vis  = toBgr8U(step.image);
			const int availW   = TILE_W - 2 * PAD;
			const int availH   = TILE_H - 2 * PAD;
			const double scale = std::min(static_cast<double>(availW) / vis.cols, static_cast<double>(availH) / vis.rows);
			const int w        = std::clamp(static_cast<int>(std::lround(vis.cols * scale)), 1, availW);
			const int h        = std::clamp(static_cast<int>(std::lround(vis.rows * scale)), 1, availH);

			cv::Mat resized;
			cv::resize(vis, resized, cv::Size(w, h), 0.0, 0.0, scale < 1.0 ? cv::INTER_AREA : cv::INTER_NEAREST);
			resized.copyTo(mosaic(cv::Rect(x + PAD + (availW - w) / 2, y + LABEL_H + PAD + (availH - h) / 2, w, h)));
		}
	}

	return mosaic;
}

cv::Mat DebugVisualizer::toBgr8U(const cv::Mat& in) {
	cv::Mat out;
	if (in.depth() != CV_8U) {
		cv::normalize(in, out, 0, 255, cv::NORM_MINMAX, CV_8U);
	} else {
		out = in;
	}

	if (out.channels() == 1) {
		cv::cvtColor(out, out, cv::COLOR_GRAY2BGR);
	} else if (out.channels() == 4) {
		cv::cvtColor(out, out, cv::COLOR_BGRA2BGR);
	}
	return out;
}

} // namespace marksman::vision::core
