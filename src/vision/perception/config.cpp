#include "vision/config.hpp"
#include "vision/core/centerResolver.hpp"

#include <boost/log/trivial.hpp>
#include <yaml-cpp/yaml.h>

#include <cmath>
#include <fstream>
#include <sstream>

namespace marksman::vision {

namespace {

//! Overwrite `out` if the key exists. Throws YAML::Exception on a type mismatch.
template <typename T>
void readValue(const YAML::Node& node, const char* key, T& out) {
	if (node && node[key]) {
		out = node[key].template as<T>();
	}
}

static core::ScoringMode parseMode(const std::string& name) {
	if (name == "ring_table") {
		return core::ScoringMode::RingTable;
	}
	if (name != "linear") {
		BOOST_LOG_TRIVIAL(warning) << "Unknown scoring mode '" << name << "', using linear";
	}
	return core::ScoringMode::Linear;
}

static bool isPositive(const double value) {
	return std::isfinite(value) && value > 0.0;
}

} // namespace

std::string validateConfig(const EngineConfig& config) {
	const auto& d = config.detection;
	if (d.thresholdValue < 0 || d.thresholdValue > 255) {
		return "threshold must be within 0-255";
	}
	if (!(d.minHoleRadius > 0.0f) || !(d.maxHoleRadius > 0.0f)) {
		return "hole radius bounds must be positive";
	}
	if (d.minHoleRadius > d.maxHoleRadius) {
		return "min_hole_radius must not exceed max_hole_radius";
	}
	if (!(d.minCircularity >= 0.0f && d.minCircularity <= 1.0f)) {
		return "min_circularity must be within 0-1";
	}

	const auto& s = config.scoring;
	if (!isPositive(s.pixelsPerMm)) {
		return "pixels_per_mm must be positive";
	}
	if (!isPositive(s.targetDiameterMm) || !isPositive(s.ring10DiameterMm) || !isPositive(s.ringWidthMm)) {
		return "target dimensions must be positive";
	}
	if (!std::isfinite(s.bulletDiameterMm) || s.bulletDiameterMm < 0.0) {
		return "bullet_diameter_mm must not be negative";
	}

	if (!(config.tracking.dedupTolerancePx >= 0.0)) {
		return "dedup_tolerance_px must not be negative";
	}

	const auto& c = config.crop;
	if (c.left < 0 || c.right < 0 || c.top < 0 || c.bottom < 0) {
		return "crop margins must not be negative";
	}

	if (config.manualCenter && !core::isUsableCenter(*config.manualCenter)) {
		return "manual_center must be a finite pixel position";
	}

	return {};
}

std::optional<EngineConfig> parseConfig(const std::string& yamlText) {
	EngineConfig config{};

	try {
		const YAML::Node root = YAML::Load(yamlText);
		if (root.IsNull()) {
			return config;
		}
		if (!root.IsMap()) {
			BOOST_LOG_TRIVIAL(error) << "Configuration root must be a map";
			return std::nullopt;
		}

		const YAML::Node detection = root["detection"];
		readValue(detection, "threshold", config.detection.thresholdValue);
		readValue(detection, "min_hole_radius", config.detection.minHoleRadius);
		readValue(detection, "max_hole_radius", config.detection.maxHoleRadius);
		readValue(detection, "min_circularity", config.detection.minCircularity);
		readValue(detection, "min_contour_points", config.detection.minContourPoints);
		readValue(detection, "max_contour_points", config.detection.maxContourPoints);

		const YAML::Node scoring = root["scoring"];
		readValue(scoring, "target_diameter_mm", config.scoring.targetDiameterMm);
		readValue(scoring, "ring_10_diameter_mm", config.scoring.ring10DiameterMm);
		readValue(scoring, "bullet_diameter_mm", config.scoring.bulletDiameterMm);
		readValue(scoring, "pixels_per_mm", config.scoring.pixelsPerMm);
		readValue(scoring, "ring_width_mm", config.scoring.ringWidthMm);
		if (scoring && scoring["mode"]) {
			config.scoring.mode = parseMode(scoring["mode"].as<std::string>());
		}

		readValue(root["tracking"], "dedup_tolerance_px", config.tracking.dedupTolerancePx);

		const YAML::Node crop = root["crop"];
		readValue(crop, "left", config.crop.left);
		readValue(crop, "right", config.crop.right);
		readValue(crop, "top", config.crop.top);
		readValue(crop, "bottom", config.crop.bottom);

		const YAML::Node center = root["manual_center"];
		if (center && !center.IsNull()) {
			if (!center.IsSequence() || center.size() != 2u) {
				BOOST_LOG_TRIVIAL(error) << "manual_center must be a sequence [x, y]";
				return std::nullopt;
			}
			config.manualCenter = cv::Point2f(center[0].as<float>(), center[1].as<float>());
		}
	} catch (const YAML::Exception& e) {
		BOOST_LOG_TRIVIAL(error) << "Invalid configuration: " << e.what();
		return std::nullopt;
	}

	return config;
}

std::optional<EngineConfig> loadConfig(const std::filesystem::path& path) {
	std::ifstream file(path);
	if (!file.is_open()) {
		BOOST_LOG_TRIVIAL(error) << "Cannot open configuration file " << path.string();
		return std::nullopt;
	}

	std::stringstream buffer;
	buffer << file.rdbuf();

	auto config = parseConfig(buffer.str());
	if (config) {
		BOOST_LOG_TRIVIAL(debug) << "Loaded configuration from " << path.string();
	}
	return config;
}

} // namespace marksman::vision
