#include "matcher/core/configLoader.hpp"
#include "matcher/exporter.hpp"
#include "matcher/matchPass.hpp"
#include "matcher/snapshotIo.hpp"

#include <opencv2/imgcodecs.hpp>

#include <cstdlib>
#include <filesystem>
#include <format>
#include <iostream>
#include <string_view>

namespace {

static void printUsage() {
	std::cerr << "Usage:\n"
	             "  matchRunner match  <snapshot> <config dir> [output snapshot]\n"
	             "  matchRunner export <snapshot> <config dir> <export file> [output snapshot]\n"
	             "Set VALVESCAN_DEBUG_MOSAIC=<image path> to save the stage renderings of a match.\n";
}

static std::string_view outcomeName(valvescan::matcher::core::TagOutcome outcome) {
	switch (outcome) {
	case valvescan::matcher::core::TagOutcome::Resolved:
		return "resolved";
	case valvescan::matcher::core::TagOutcome::NoCluster:
		return "no cluster";
	case valvescan::matcher::core::TagOutcome::Unmatched:
		return "unmatched";
	}
	return "?";
}

static void printReport(const valvescan::matcher::MatchPassResult& result) {
	for (const auto& report: result.tags) {
		std::cout << std::format("{:<16} {:<10} entities={:<3} {}\n", report.tag.text, outcomeName(report.outcome), report.clusterSize,
		                         report.patternName.value_or("-"));
	}
	const auto& stats = result.stats;
	std::cout << std::format("tags={} records={} flagged={} markers +{}/-{} skipped={} rejected={}\n", stats.tagsAnalysed, stats.recordsCreated,
	                         stats.tagsFlagged, stats.markersAdded, stats.markersRemoved, stats.primitivesSkipped, stats.claimsRejected);
}

static std::optional<valvescan::matcher::core::MatcherConfig> loadConfig(const std::filesystem::path& configDir) {
	const std::filesystem::path path = configDir / "matcher.yml";
	if (!std::filesystem::exists(path)) {
		return valvescan::matcher::core::MatcherConfig{};
	}
	return valvescan::matcher::core::loadMatcherConfig(path);
}

static int runMatch(valvescan::DrawingSnapshot& snapshot, const valvescan::matcher::core::MatchLibraries& libraries,
                    const valvescan::matcher::core::MatcherConfig& config, const std::filesystem::path& output) {
	const char* mosaicPath = std::getenv("VALVESCAN_DEBUG_MOSAIC");
	valvescan::matcher::core::DebugVisualizer debugger;

	const auto result = valvescan::matcher::runMatchPass(snapshot, libraries, config, mosaicPath != nullptr ? &debugger : nullptr);
	if (!result.success) {
		return EXIT_FAILURE;
	}
	printReport(result);

	if (mosaicPath != nullptr) {
		const cv::Mat mosaic = debugger.buildMosaic();
		bool written         = false;
		try {
			written = !mosaic.empty() && cv::imwrite(mosaicPath, mosaic);
		} catch (const cv::Exception& e) {
			std::cerr << e.msg << '\n';
		}
		if (!written) {
			std::cerr << "Failed to write debug mosaic: " << mosaicPath << '\n';
		}
	}

	if (output.empty()) {
		return EXIT_SUCCESS;
	}
	if (!valvescan::matcher::applyMutations(snapshot, result.mutations)) {
		return EXIT_FAILURE;
	}
	return valvescan::matcher::writeSnapshot(snapshot, output) ? EXIT_SUCCESS : EXIT_FAILURE;
}

static int runExport(valvescan::DrawingSnapshot& snapshot, const valvescan::matcher::core::MatchLibraries& libraries,
                     const valvescan::matcher::core::MatcherConfig& config, const std::filesystem::path& exportFile, const std::filesystem::path& output) {
	valvescan::matcher::FileExportSink sink(exportFile);
	const auto result = valvescan::matcher::matchAndExport(snapshot, libraries, config, sink);
	printReport(result.pass);

	// Applied mutations are kept even if the export failed.
	if (result.mutationsApplied && !output.empty() && !valvescan::matcher::writeSnapshot(snapshot, output)) {
		return EXIT_FAILURE;
	}
	return result.success ? EXIT_SUCCESS : EXIT_FAILURE;
}

} // namespace

int main(int argc, char** argv) {
	if (argc < 4) {
		printUsage();
		return EXIT_FAILURE;
	}

	const std::string_view command           = argv[1];
	const std::filesystem::path snapshotPath = argv[2];
	const std::filesystem::path configDir    = argv[3];

	if (command != "match" && command != "export") {
		printUsage();
		return EXIT_FAILURE;
	}
	if (command == "export" && argc < 5) {
		printUsage();
		return EXIT_FAILURE;
	}

	auto snapshot = valvescan::matcher::readSnapshot(snapshotPath);
	if (!snapshot.has_value()) {
		return EXIT_FAILURE;
	}

	const auto libraries = valvescan::matcher::core::loadMatchLibraries(valvescan::matcher::core::libraryPathsIn(configDir));
	if (!libraries.has_value()) {
		std::cerr << "Valve matching aborted: configuration could not be loaded.\n";
		return EXIT_FAILURE;
	}

	const auto config = loadConfig(configDir);
	if (!config.has_value()) {
		return EXIT_FAILURE;
	}

	if (command == "match") {
		return runMatch(*snapshot, *libraries, *config, argc > 4 ? std::filesystem::path(argv[4]) : std::filesystem::path{});
	}
	return runExport(*snapshot, *libraries, *config, argv[4], argc > 5 ? std::filesystem::path(argv[5]) : std::filesystem::path{});
}
