#pragma once

#include "vision/core/frame.hpp"
#include "vision/core/holeFinder.hpp"
#include "vision/core/scoringModel.hpp"
#include "vision/core/shotTracker.hpp"

#include <opencv2/core/types.hpp>

#include <filesystem>
#include <optional>
#include <string>

namespace marksman::vision {

//! Every tunable of a scoring session. Defaults describe an ISSF 50m rifle target.
struct EngineConfig {
	core::DetectionConfig detection{};
	core::ScoringConfig scoring{};
	core::TrackerConfig tracking{};
	core::CropMargins crop{};
	std::optional<cv::Point2f> manualCenter{}; //!< In cropped frame coordinates.
};

//! Describes the first problem found in a configuration. Empty if the configuration is usable.
std::string validateConfig(const EngineConfig& config);

inline bool isValidConfig(const EngineConfig& config) {
	return validateConfig(config).empty();
}

/*! Parse a YAML configuration. Missing keys keep their defaults.
 * \returns std::nullopt if the text is not valid YAML or a value has the wrong type.
 */
std::optional<EngineConfig> parseConfig(const std::string& yamlText);

//! Load a YAML configuration file. See parseConfig.
std::optional<EngineConfig> loadConfig(const std::filesystem::path& path);

} // namespace marksman::vision
