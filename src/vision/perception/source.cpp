#include "vision/source.hpp"

#include <boost/log/trivial.hpp>

#include <opencv2/imgcodecs.hpp>
#include <opencv2/imgproc.hpp>

#include <array>
#include <chrono>

namespace marksman::vision {

namespace {

//! Back off after a failed read so a disconnected camera does not spin.
static constexpr auto READ_RETRY_DELAY = std::chrono::milliseconds(100);

struct Resolution {
	int width;
	int height;
};

static constexpr Resolution DEFAULT_RESOLUTION{1280, 720};
static constexpr std::array<Resolution, 2> MAX_RESOLUTION_HINTS{{{3840, 2160}, {1920, 1080}}};

//! Request a resolution. The driver picks the closest supported mode.
static void requestResolution(cv::VideoCapture& capture, const bool useMaxResolution) {
	if (!useMaxResolution) {
		capture.set(cv::CAP_PROP_FRAME_WIDTH, DEFAULT_RESOLUTION.width);
		capture.set(cv::CAP_PROP_FRAME_HEIGHT, DEFAULT_RESOLUTION.height);
		return;
	}

	for (const auto& hint: MAX_RESOLUTION_HINTS) {
		if (capture.set(cv::CAP_PROP_FRAME_WIDTH, hint.width) && capture.set(cv::CAP_PROP_FRAME_HEIGHT, hint.height)) {
			return;
		}
	}
}

} // namespace

void LatestFrame::put(cv::Mat frame) {
	std::lock_guard lock(m_mutex);
	m_frame = std::move(frame);
}

std::optional<cv::Mat> LatestFrame::take() {
	std::lock_guard lock(m_mutex);
	std::optional<cv::Mat> frame = std::move(m_frame);
	m_frame.reset();
	return frame;
}

bool LatestFrame::hasFrame() const {
	std::lock_guard lock(m_mutex);
	return m_frame.has_value();
}


CameraSource::CameraSource(CameraOptions options) : m_options{options} {
}

CameraSource::~CameraSource() {
	stop();
}

bool CameraSource::start() {
	if (m_running.load()) {
		return true;
	}

	if (!m_capture.open(m_options.index, cv::CAP_ANY)) {
		BOOST_LOG_TRIVIAL(error) << "Failed to open camera " << m_options.index;
		return false;
	}
	requestResolution(m_capture, m_options.useMaxResolution);

	BOOST_LOG_TRIVIAL(info) << "Camera " << m_options.index << " opened at " << m_capture.get(cv::CAP_PROP_FRAME_WIDTH) << "x"
	                        << m_capture.get(cv::CAP_PROP_FRAME_HEIGHT);

	m_running.store(true);
	m_captureThread = std::thread([this]() { captureLoop(); });
	return true;
}

void CameraSource::stop() {
	if (!m_running.exchange(false)) {
		return;
	}

	if (m_captureThread.joinable()) {
		m_captureThread.join();
	}
	m_capture.release();
}

bool CameraSource::isRunning() const {
	return m_running.load();
}

std::optional<cv::Mat> CameraSource::poll() {
	return m_latest.take();
}

Source CameraSource::kind() const {
	return Source::Camera;
}

void CameraSource::captureLoop() {
	cv::Mat bgr;
	while (m_running.load()) {
		if (!m_capture.read(bgr) || bgr.empty()) {
			BOOST_LOG_TRIVIAL(warning) << "Failed to read frame from camera " << m_options.index;
			std::this_thread::sleep_for(READ_RETRY_DELAY);
			continue;
		}

		cv::Mat rgb;
		cv::cvtColor(bgr, rgb, cv::COLOR_BGR2RGB);
		m_latest.put(std::move(rgb));
	}
}


ImageSource::ImageSource(cv::Mat rgbImage) {
	setImage(std::move(rgbImage));
}

bool ImageSource::load(const std::filesystem::path& path) {
	cv::Mat rgb = readRgbImage(path);
	if (rgb.empty()) {
		BOOST_LOG_TRIVIAL(error) << "Failed to load image " << path.string();
		return false;
	}

	setImage(std::move(rgb));
	return true;
}

void ImageSource::setImage(cv::Mat rgbImage) {
	std::lock_guard lock(m_mutex);
	m_image              = std::move(rgbImage);
	m_reprocessRequested = !m_image.empty();
}

void ImageSource::requestReprocess() {
	std::lock_guard lock(m_mutex);
	m_reprocessRequested = !m_image.empty();
}

bool ImageSource::hasImage() const {
	std::lock_guard lock(m_mutex);
	return !m_image.empty();
}

std::optional<cv::Mat> ImageSource::poll() {
	std::lock_guard lock(m_mutex);
	if (!m_reprocessRequested) {
		return std::nullopt;
	}
	m_reprocessRequested = false;
	return m_image.clone();
}

Source ImageSource::kind() const {
	return Source::Image;
}


cv::Mat readRgbImage(const std::filesystem::path& path) {
	const cv::Mat bgr = cv::imread(path.string(), cv::IMREAD_COLOR);
	if (bgr.empty()) {
		return {};
	}

	cv::Mat rgb;
	cv::cvtColor(bgr, rgb, cv::COLOR_BGR2RGB);
	return rgb;
}

} // namespace marksman::vision
