#pragma once

#include <opencv2/core/mat.hpp>
#include <opencv2/videoio.hpp>

#include <atomic>
#include <filesystem>
#include <mutex>
#include <optional>
#include <thread>

namespace marksman::vision {

enum class Source { Camera, Image };

//! Single slot frame buffer. The producer overwrites, the consumer takes. Older frames are dropped.
class LatestFrame {
public:
	void put(cv::Mat frame);       //!< Replace the stored frame.
	std::optional<cv::Mat> take(); //!< Remove and return the stored frame. Never blocks on a producer.
	bool hasFrame() const;

private:
	mutable std::mutex m_mutex;
	std::optional<cv::Mat> m_frame{};
};

//! Produces RGB frames (CV_8UC3) for a scoring session.
class FrameSource {
public:
	virtual ~FrameSource() = default;

	//! Non blocking pull of the newest frame not handed out yet.
	//! \returns std::nullopt if nothing new is available.
	virtual std::optional<cv::Mat> poll() = 0;

	virtual Source kind() const = 0;
};

struct CameraOptions {
	int index{0};                 //!< Device index passed to cv::VideoCapture.
	bool useMaxResolution{false}; //!< Ask for the highest resolution instead of 720p.
};

//! Captures frames on a background thread. Only the newest frame is kept.
class CameraSource : public FrameSource {
public:
	explicit CameraSource(CameraOptions options = CameraOptions{});
	~CameraSource() override;

	//! Open the device and start capturing. Returns false if the device cannot be opened.
	bool start();
	void stop();
	bool isRunning() const;

	std::optional<cv::Mat> poll() override;
	Source kind() const override;

private:
	void captureLoop(); //!< Runs on m_captureThread.

private:
	CameraOptions m_options;
	cv::VideoCapture m_capture{}; //!< Only touched by m_captureThread while running.
	LatestFrame m_latest{};

	std::atomic<bool> m_running{false};
	std::thread m_captureThread{};
};

//! Static image. Hands out the image once after loading and once after each requestReprocess().
class ImageSource : public FrameSource {
public:
	ImageSource() = default;
	explicit ImageSource(cv::Mat rgbImage);

	//! Load an image file and request one pass. Keeps the previous image if loading fails.
	bool load(const std::filesystem::path& path);
	void setImage(cv::Mat rgbImage);
	void requestReprocess();

	bool hasImage() const;

	std::optional<cv::Mat> poll() override;
	Source kind() const override;

private:
	mutable std::mutex m_mutex;
	cv::Mat m_image{};
	bool m_reprocessRequested{false};
};

//! Read an image file as an RGB frame. Empty Mat if it cannot be decoded.
cv::Mat readRgbImage(const std::filesystem::path& path);

} // namespace marksman::vision
