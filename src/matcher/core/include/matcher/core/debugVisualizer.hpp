#pragma once

#include "model/drawing.hpp"

#include <opencv2/core/mat.hpp>

#include <string>
#include <vector>

namespace valvescan::matcher::core {

//! One rendered view within a stage.
struct DebugStep {
	std::string name; //!< Caption drawn on the tile.
	cv::Mat image;    //!< Rendering of the drawing after the step.
};

//! A matching pass has several stages (tags, clusters, ownership, markers). We collect the views per stage.
struct DebugStage {
	std::string name;               //!< Name of the stage. Shown as row label in the mosaic.
	std::vector<DebugStep> steps{}; //!< Views in the order they were added.
};

//! Can be passed to the matching functions to collect intermediate renderings for tuning and debugging.
class DebugVisualizer {
public:
	void beginStage(std::string name);              //!< New stage starts. Ends the active stage.
	void add(std::string name, const cv::Mat& img); //!< Add a view to the active stage. Shown immediately in interactive mode.
	void endStage();

	//! Mosaic with one row per stage. Ends the active stage. Empty if nothing was collected.
	cv::Mat buildMosaic();

	void setInteractive(bool interactive, unsigned displayTimeMs = 0u); //!< 0 -> wait for a key press.
	void clear();

	const std::vector<DebugStage>& stages() const { return m_stages; }

private:
	bool m_interactive{false};  //!< Show every view as soon as it is added.
	unsigned m_displayTime{0u}; //!< How many ms to show a view in interactive mode. 0->wait for a key.

	DebugStage m_currentStage{};        //!< Stage collecting views right now.
	bool m_hasActiveStage{false};       //!< beginStage() was called without a matching endStage().
	std::vector<DebugStage> m_stages{}; //!< Finished stages.
};

//! Renders drawing entities into an image. Drawing y points up, image y points down.
class DrawingCanvas {
public:
	//! \param [in] world     Drawing area to show.
	//! \param [in] maxSidePx Longest image side in pixels.
	explicit DrawingCanvas(const Extents& world, int maxSidePx = 900);

	//! Extents covering every entity of the snapshot.
	static Extents worldOf(const DrawingSnapshot& snapshot);

	cv::Mat blank() const;
	cv::Point toPixel(const cv::Point2d& point) const;

	void drawPrimitive(cv::Mat& image, const Primitive& primitive, const cv::Scalar& color) const;
	void drawBox(cv::Mat& image, const Extents& box, const cv::Scalar& color, int thickness = 1) const;
	void drawCircle(cv::Mat& image, const cv::Point2d& center, double radius, const cv::Scalar& color, int thickness = 1) const;
	void drawLabel(cv::Mat& image, const cv::Point2d& anchor, const std::string& text, const cv::Scalar& color) const;
	void drawMarker(cv::Mat& image, const Marker& marker, const cv::Scalar& color) const;

private:
	Extents m_world;     //!< Drawing area mapped onto the image.
	double m_scale{1.0}; //!< Pixels per drawing unit.
	cv::Size m_size{};   //!< Image size of blank().
};

} // namespace valvescan::matcher::core
