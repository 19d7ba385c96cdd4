#include "matcher/exporter.hpp"

#include "matcher/snapshotIo.hpp"

#include <chrono>
#include <format>
#include <fstream>
#include <iostream>
#include <thread>

#include <opencv2/core/persistence.hpp>

namespace valvescan::matcher {

FileExportSink::FileExportSink(std::filesystem::path path) : m_path(std::move(path)) {
}

ExportResponse FileExportSink::send(const std::string& payload) {
	std::ofstream file(m_path, std::ios::binary | std::ios::trunc);
	if (!file.is_open()) {
		return {false, std::format("Cannot open export file '{}'.", m_path.string())};
	}
	file << payload;
	if (!file.good()) {
		return {false, std::format("Cannot write export file '{}'.", m_path.string())};
	}
	return {true, std::format("Wrote {} byte(s) to '{}'.", payload.size(), m_path.string())};
}

std::vector<MatchRecord> exportableRecords(const std::vector<MatchRecord>& records) {
	std::vector<MatchRecord> exportable;
	for (const auto& record: records) {
		const auto it = record.attributes.find(VALVE_TAG_KEY);
		if (it != record.attributes.end() && !it->second.empty()) {
			exportable.push_back(record);
		}
	}
	return exportable;
}

std::optional<std::string> serializeRecords(const std::vector<MatchRecord>& records) {
	try {
		cv::FileStorage storage(".json", cv::FileStorage::WRITE | cv::FileStorage::MEMORY | cv::FileStorage::FORMAT_JSON);
		storage << "records" << "[";
		for (const auto& record: records) {
			storage << "{";
			storage << BLOCK_NAME_KEY << record.patternName;
			for (const auto& [key, value]: record.attributes) {
				if (key != BLOCK_NAME_KEY) {
					storage << key << value;
				}
			}
			storage << "}";
		}
		storage << "]";
		return storage.releaseAndGetString();
	} catch (const cv::Exception& e) {
		std::cerr << "Failed to serialize valve records: " << e.msg << '\n';
		return std::nullopt;
	}
}

ExportResult matchAndExport(DrawingSnapshot& snapshot, const core::MatchLibraries& libraries, const core::MatcherConfig& config, ExportSink& sink) {
	ExportResult result{};

	std::cout << "Running valve matching...\n";
	result.pass = runMatchPass(snapshot, libraries, config);
	if (!result.pass.success) {
		return result;
	}

	result.mutationsApplied = applyMutations(snapshot, result.pass.mutations);
	if (!result.mutationsApplied) {
		std::cerr << "Marker mutations could not be applied. Nothing exported.\n";
		return result;
	}

	// Give the host time to settle the committed changes.
	if (config.exporting.settleDelayMs > 0u) {
		std::this_thread::sleep_for(std::chrono::milliseconds(config.exporting.settleDelayMs));
	}

	std::cout << "Exporting matched valve blocks...\n";
	const std::vector<MatchRecord> records = exportableRecords(result.pass.records);
	const auto payload                     = serializeRecords(records);
	if (!payload.has_value()) {
		result.response = {false, "Serialization failed."};
		return result;
	}

	result.response = sink.send(*payload);
	if (!result.response.success) {
		std::cerr << "Export failed: " << result.response.body << '\n';
		return result;
	}

	result.exported = records.size();
	std::cout << std::format("Exported {} valve block(s). Response: {}\n", result.exported, result.response.body);
	result.success = true;
	return result;
}

} // namespace valvescan::matcher
