#include "mainWindow.hpp"

#include <QDoubleSpinBox>
#include <QHBoxLayout>
#include <QLabel>
#include <QPainter>
#include <QVBoxLayout>

#include <opencv2/imgproc.hpp>

namespace valvescan {

CvMatrixView::CvMatrixView(QWidget* parent) : QWidget(parent) {
}

void CvMatrixView::setMat(const cv::Mat& mat) {
	m_image = matToQImage(mat);
	update();
}

void CvMatrixView::paintEvent(QPaintEvent* event) {
	QWidget::paintEvent(event);

	QPainter painter(this);
	painter.fillRect(rect(), Qt::black);

	if (m_image.isNull()) {
		return;
	}

	const QImage scaled = m_image.scaled(size(), Qt::KeepAspectRatio, Qt::SmoothTransformation);
	const QPoint topLeft((width() - scaled.width()) / 2, (height() - scaled.height()) / 2);
	painter.drawImage(topLeft, scaled);
}

//! Debug renderings are always 8 bit BGR.
QImage CvMatrixView::matToQImage(const cv::Mat& mat) {
	if (mat.empty() || mat.type() != CV_8UC3) {
		return {};
	}

	cv::Mat rgb;
	cv::cvtColor(mat, rgb, cv::COLOR_BGR2RGB);
	const QImage image(rgb.data, rgb.cols, rgb.rows, static_cast<int>(rgb.step), QImage::Format_RGB888);
	return image.copy();
}

MainWindow::MainWindow(const matcher::core::MatcherConfig& config, QWidget* parent) : QMainWindow(parent), m_baseConfig(config) {
	setWindowTitle("Match Tuner");
	buildLayout();
}

MainWindow::~MainWindow() = default;

void MainWindow::setImage(const cv::Mat& image) {
	if (m_matrixView != nullptr) {
		m_matrixView->setMat(image);
	}
}

void MainWindow::setSummary(const QString& text) {
	if (m_summary != nullptr) {
		m_summary->setText(text);
	}
}

void MainWindow::setConfigChangedCallback(std::function<void(const matcher::core::MatcherConfig&)> callback) {
	m_configChangedCallback = std::move(callback);
}

matcher::core::MatcherConfig MainWindow::config() const {
	matcher::core::MatcherConfig config = m_baseConfig;
	config.cluster.proximityRadius      = m_proximityRadius->value();
	config.cluster.linkTolerance        = m_linkTolerance->value();
	config.ownership.ambiguityTolerance = m_ambiguityTolerance->value();
	config.composition.maxLineLength    = m_maxLineLength->value();
	return config;
}

QDoubleSpinBox* MainWindow::addSpinBox(const QString& label, double value, double max, QHBoxLayout* row) {
	auto* spinBox = new QDoubleSpinBox(centralWidget());
	spinBox->setRange(0.0, max);
	spinBox->setDecimals(1);
	spinBox->setSingleStep(0.5);
	spinBox->setValue(value);

	row->addWidget(new QLabel(label, centralWidget()));
	row->addWidget(spinBox);
	QObject::connect(spinBox, &QDoubleSpinBox::valueChanged, this, [this](double) { notifyConfigChanged(); });
	return spinBox;
}

void MainWindow::notifyConfigChanged() {
	if (m_configChangedCallback) {
		m_configChangedCallback(config());
	}
}

void MainWindow::buildLayout() {
	auto* rootWidget = new QWidget(this);
	setCentralWidget(rootWidget);

	auto* rootLayout   = new QVBoxLayout(rootWidget);
	auto* toleranceRow = new QHBoxLayout();

	m_proximityRadius    = addSpinBox("Proximity radius:", m_baseConfig.cluster.proximityRadius, 500.0, toleranceRow);
	m_linkTolerance      = addSpinBox("Link tolerance:", m_baseConfig.cluster.linkTolerance, 100.0, toleranceRow);
	m_ambiguityTolerance = addSpinBox("Ambiguity tolerance:", m_baseConfig.ownership.ambiguityTolerance, 500.0, toleranceRow);
	m_maxLineLength      = addSpinBox("Max line length:", m_baseConfig.composition.maxLineLength, 1000.0, toleranceRow);
	toleranceRow->addStretch(1);

	m_summary    = new QLabel(rootWidget);
	m_matrixView = new CvMatrixView(rootWidget);

	rootLayout->addLayout(toleranceRow);
	rootLayout->addWidget(m_summary);
	rootLayout->addWidget(m_matrixView, 1);
}

} // namespace valvescan
