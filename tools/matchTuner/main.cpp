#include <filesystem>
#include <format>

#include <QApplication>

#include "analyser.hpp"
#include "mainWindow.hpp"
#include "matcher/snapshotIo.hpp"

namespace {

static QString summaryOf(const valvescan::matcher::PassStats& stats) {
	return QString::fromStdString(std::format("Tags: {}   Matched: {}   Flagged: {}   Claims rejected: {}   Skipped primitives: {}", stats.tagsAnalysed,
	                                          stats.recordsCreated, stats.tagsFlagged, stats.claimsRejected, stats.primitivesSkipped));
}

} // namespace

// Usage: matchTuner <snapshot> <config dir>
// The config dir holds patterns.yml, prefixes.csv, layers.csv and optionally catalog.yml, facilities.yml and matcher.yml.
// Without arguments the test fixtures are used.
int main(int argc, char** argv) {
	QApplication application(argc, argv);

	const std::filesystem::path snapshotPath = argc > 1 ? std::filesystem::path(argv[1]) : std::filesystem::path(PATH_TEST_DATA) / "drawing.yml";
	const std::filesystem::path configDir    = argc > 2 ? std::filesystem::path(argv[2]) : std::filesystem::path(PATH_TEST_DATA);

	auto snapshot = valvescan::matcher::readSnapshot(snapshotPath);
	if (!snapshot.has_value()) {
		return 1;
	}

	auto libraries = valvescan::matcher::core::loadMatchLibraries(valvescan::matcher::core::libraryPathsIn(configDir));
	if (!libraries.has_value()) {
		return 1;
	}

	valvescan::matcher::core::MatcherConfig config{};
	if (std::filesystem::exists(configDir / "matcher.yml")) {
		const auto loaded = valvescan::matcher::core::loadMatcherConfig(configDir / "matcher.yml");
		if (!loaded.has_value()) {
			return 1;
		}
		config = *loaded;
	}

	valvescan::matcher::Analyser analyser(std::move(*snapshot), std::move(*libraries));

	valvescan::MainWindow window(config);
	window.resize(1400, 900);

	const auto refresh = [&window, &analyser](const valvescan::matcher::core::MatcherConfig& current) {
		window.setImage(analyser.analyse(current));
		window.setSummary(summaryOf(analyser.lastStats()));
	};
	window.setConfigChangedCallback(refresh);
	refresh(config);

	window.show();
	return application.exec();
}
