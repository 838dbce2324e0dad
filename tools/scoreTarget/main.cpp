#include "vision/config.hpp"
#include "vision/core/debugVisualizer.hpp"
#include "vision/core/frame.hpp"
#include "vision/core/overlay.hpp"
#include "vision/logging.hpp"
#include "vision/session.hpp"
#include "vision/source.hpp"

#include <boost/log/trivial.hpp>

#include <opencv2/imgcodecs.hpp>
#include <opencv2/imgproc.hpp>

#include <atomic>
#include <chrono>
#include <csignal>
#include <exception>
#include <filesystem>
#include <iostream>
#include <optional>
#include <string>
#include <string_view>
#include <thread>
#include <vector>

namespace marksman {

namespace {

std::atomic<bool> g_stopRequested{false};

void onSignal(int) {
	g_stopRequested.store(true);
}

struct Options {
	std::optional<std::filesystem::path> configPath;
	std::optional<std::filesystem::path> overlayPath; //!< Overlay of the last processed frame.
	std::optional<std::filesystem::path> debugPath;   //!< Debug mosaic of the last processed frame.
	std::optional<cv::Point2f> center;
	std::optional<int> cameraIndex;
	bool maxResolution{false};
	bool verbose{false};
	std::vector<std::filesystem::path> images;
};

void printUsage() {
	std::cout << "Usage: scoreTarget [options] image...\n"
	             "       scoreTarget [options] --camera <index>\n"
	             "Images are processed in order as frames of one target.\n\n"
	             "Options:\n"
	             "  --config <file.yaml>  Load detection and calibration settings.\n"
	             "  --center <x,y>        Manual target center in cropped frame pixels.\n"
	             "  --overlay <out.png>   Write the last frame with holes and rings drawn.\n"
	             "  --debug <out.png>     Write the detection stages of the last frame.\n"
	             "  --max-resolution      Ask the camera for its highest resolution.\n"
	             "  --verbose             Debug logging.\n";
}

std::optional<cv::Point2f> parsePoint(const std::string& text) {
	const auto comma = text.find(',');
	if (comma == std::string::npos) {
		return std::nullopt;
	}
	try {
		return cv::Point2f(std::stof(text.substr(0, comma)), std::stof(text.substr(comma + 1)));
	} catch (const std::exception&) {
		return std::nullopt;
	}
}

//! \returns std::nullopt if the arguments cannot be parsed.
std::optional<Options> parseArgs(int argc, char** argv) {
	Options options;
	for (int i = 1; i < argc; ++i) {
		const std::string_view arg = argv[i];
		const bool hasValue        = i + 1 < argc;

		if (arg == "--config" && hasValue) {
			options.configPath = argv[++i];
		} else if (arg == "--overlay" && hasValue) {
			options.overlayPath = argv[++i];
		} else if (arg == "--debug" && hasValue) {
			options.debugPath = argv[++i];
		} else if (arg == "--center" && hasValue) {
			options.center = parsePoint(argv[++i]);
			if (!options.center) {
				return std::nullopt;
			}
		} else if (arg == "--camera" && hasValue) {
			try {
				options.cameraIndex = std::stoi(argv[++i]);
			} catch (const std::exception&) {
				return std::nullopt;
			}
		} else if (arg == "--max-resolution") {
			options.maxResolution = true;
		} else if (arg == "--verbose") {
			options.verbose = true;
		} else if (arg.starts_with("--")) {
			return std::nullopt;
		} else {
			options.images.emplace_back(argv[i]);
		}
	}

	if (options.images.empty() == !options.cameraIndex.has_value()) {
		return std::nullopt; // Exactly one input kind.
	}
	return options;
}

void printShot(const std::size_t number, const vision::core::ShotRecord& shot) {
	std::cout << "Shot " << number << ": " << shot.score << " at (" << shot.position.x << ", " << shot.position.y << "), " << shot.distanceMm
	          << " mm from center\n";
}

void printSummary(const vision::ScoringSession& session) {
	const auto summary = session.summary();
	std::cout << "Total: " << summary.total << " from " << summary.shotCount << " shots, average " << summary.average << '\n';
}

bool writeRgb(const std::filesystem::path& path, const cv::Mat& rgb) {
	cv::Mat bgr;
	cv::cvtColor(rgb, bgr, cv::COLOR_RGB2BGR);
	if (!cv::imwrite(path.string(), bgr)) {
		BOOST_LOG_TRIVIAL(error) << "Failed to write " << path.string();
		return false;
	}
	return true;
}

int scoreImages(vision::ScoringSession& session, const Options& options) {
	vision::core::DebugVisualizer debugger;
	cv::Mat lastFrame;
	std::size_t shotNumber = 0;

	for (const auto& path: options.images) {
		const cv::Mat frame = vision::readRgbImage(path);
		if (frame.empty()) {
			BOOST_LOG_TRIVIAL(error) << "Failed to load image " << path.string();
			continue;
		}

		debugger.clear();
		const auto detection = session.processFrame(frame, options.debugPath ? &debugger : nullptr);
		if (!detection.success) {
			continue;
		}
		lastFrame = vision::core::cropFrame(frame, session.config().crop);
	}

	for (const auto& shot: session.shots()) {
		printShot(++shotNumber, shot);
	}
	printSummary(session);

	if (lastFrame.empty()) {
		return 1;
	}

	bool written = true;
	if (options.overlayPath) {
		const auto detection = session.lastDetection();
		if (detection) {
			written = writeRgb(*options.overlayPath, vision::core::drawOverlay(lastFrame, *detection, session.config().scoring)) && written;
		}
	}
	if (options.debugPath) {
		const cv::Mat mosaic = debugger.buildMosaic();
		if (!mosaic.empty() && !cv::imwrite(options.debugPath->string(), mosaic)) {
			BOOST_LOG_TRIVIAL(error) << "Failed to write " << options.debugPath->string();
			written = false;
		}
	}
	return written ? 0 : 1;
}

int scoreCamera(vision::ScoringSession& session, const Options& options) {
	vision::CameraSource camera{{*options.cameraIndex, options.maxResolution}};
	if (!camera.start()) {
		return 1;
	}

	std::size_t shotNumber = 0;
	session.connect({[&shotNumber](const vision::core::ShotRecord& shot) { printShot(++shotNumber, shot); }, nullptr});

	std::signal(SIGINT, onSignal);
	std::signal(SIGTERM, onSignal);

	session.run(camera);
	while (!g_stopRequested.load()) {
		std::this_thread::sleep_for(std::chrono::milliseconds(100));
	}
	session.stop();
	session.disconnect();
	camera.stop();

	printSummary(session);
	return 0;
}

} // namespace

} // namespace marksman

int main(int argc, char** argv) {
	const auto options = marksman::parseArgs(argc, argv);
	if (!options) {
		marksman::printUsage();
		return 2;
	}

	marksman::vision::initLogging(options->verbose);

	marksman::vision::EngineConfig config{};
	if (options->configPath) {
		auto loaded = marksman::vision::loadConfig(*options->configPath);
		if (!loaded) {
			return 1;
		}
		config = std::move(*loaded);
	}
	if (options->center) {
		config.manualCenter = options->center;
	}

	if (const std::string problem = marksman::vision::validateConfig(config); !problem.empty()) {
		BOOST_LOG_TRIVIAL(error) << "Invalid configuration: " << problem;
		return 1;
	}

	marksman::vision::ScoringSession session{config};
	return options->cameraIndex ? marksman::scoreCamera(session, *options) : marksman::scoreImages(session, *options);
}
