#pragma once

#include "matcher/matchPass.hpp"

#include <filesystem>
#include <optional>
#include <string>
#include <vector>

namespace valvescan::matcher {

static constexpr const char* BLOCK_NAME_KEY = "BlockName";

//! Answer of an export destination. `body` is shown to the user on failure.
struct ExportResponse {
	bool success{false};
	std::string body;
};

//! Destination of the serialized record batch.
class ExportSink {
public:
	virtual ~ExportSink() = default;

	virtual ExportResponse send(const std::string& payload) = 0;
};

//! Writes the payload to a file. Used by the command line tool and in tests.
class FileExportSink : public ExportSink {
public:
	explicit FileExportSink(std::filesystem::path path);

	ExportResponse send(const std::string& payload) override;

private:
	std::filesystem::path m_path;
};

//! Records that carry a non-empty VALVE_TAG attribute.
std::vector<MatchRecord> exportableRecords(const std::vector<MatchRecord>& records);

/*! JSON document `{"records": [ {"BlockName": <pattern>, <attribute>: <value>, ...}, ... ]}`.
 *  FileStorage JSON documents need a mapping at the root, hence the `records` key.
 *  \return std::nullopt if an attribute key is not a valid FileStorage name.
 */
std::optional<std::string> serializeRecords(const std::vector<MatchRecord>& records);

struct ExportResult {
	bool success{false};
	MatchPassResult pass{};
	bool mutationsApplied{false};
	std::size_t exported{0u};
	ExportResponse response{};
};

/*! Match, commit the marker mutations to the snapshot, wait for the settle delay and export the records.
 *  An export failure is reported in the result. The committed mutations are not rolled back.
 * \param [in,out] snapshot  Drawing snapshot. Receives the marker mutations.
 * \param [in]     libraries Loaded configuration.
 * \param [in]     config    Tunables, including the settle delay.
 * \param [in]     sink      Export destination.
 */
ExportResult matchAndExport(DrawingSnapshot& snapshot, const core::MatchLibraries& libraries, const core::MatcherConfig& config, ExportSink& sink);

} // namespace valvescan::matcher
