#pragma once

#include "matcher/core/matcherConfig.hpp"

#include <QImage>
#include <QMainWindow>
#include <QWidget>

#include <opencv2/core/mat.hpp>

#include <functional>

class QDoubleSpinBox;
class QHBoxLayout;
class QLabel;

namespace valvescan {

class CvMatrixView : public QWidget {
public:
	explicit CvMatrixView(QWidget* parent = nullptr);
	void setMat(const cv::Mat& mat);

protected:
	void paintEvent(QPaintEvent* event) override;

private:
	static QImage matToQImage(const cv::Mat& mat);

	QImage m_image{};
};


//! Stage mosaic plus spin boxes for the matcher tolerances. Every edit reports the full config through the callback.
class MainWindow : public QMainWindow {
public:
	explicit MainWindow(const matcher::core::MatcherConfig& config, QWidget* parent = nullptr);
	~MainWindow() override;

	void setImage(const cv::Mat& image);
	void setSummary(const QString& text);
	void setConfigChangedCallback(std::function<void(const matcher::core::MatcherConfig&)> callback);
	matcher::core::MatcherConfig config() const;

private:
	void buildLayout();
	QDoubleSpinBox* addSpinBox(const QString& label, double value, double max, QHBoxLayout* row);
	void notifyConfigChanged();

private:
	matcher::core::MatcherConfig m_baseConfig{};

	CvMatrixView* m_matrixView{nullptr};
	QLabel* m_summary{nullptr};
	QDoubleSpinBox* m_proximityRadius{nullptr};
	QDoubleSpinBox* m_linkTolerance{nullptr};
	QDoubleSpinBox* m_ambiguityTolerance{nullptr};
	QDoubleSpinBox* m_maxLineLength{nullptr};
	std::function<void(const matcher::core::MatcherConfig&)> m_configChangedCallback{};
};

} // namespace valvescan
