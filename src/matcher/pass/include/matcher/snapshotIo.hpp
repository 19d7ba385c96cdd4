#pragma once

#include "model/drawing.hpp"

#include <filesystem>
#include <optional>
#include <vector>

// Drawing snapshots are exchanged with the host as cv::FileStorage documents (YAML or JSON, chosen by the file extension).
//
// primitives: [ { id, kind, layer, vertices: [x0, y0, x1, y1, ...], center: [x, y], radius, startAngle, endAngle, closed, color,
//                 extents: [minX, minY, maxX, maxY] } ]
// texts:      [ { id, position: [x, y], value, layer } ]
// zones:      [ { id, extents: [minX, minY, maxX, maxY] or vertices: [...], metadata: { FACILITY: ..., SUB_FACILITY: ... } } ]
// markers:    [ { id, kind: unresolved | other, center: [x, y], size } ]
namespace valvescan::matcher {

//! Read a snapshot. Entries with unknown primitive kinds make the whole file invalid.
std::optional<DrawingSnapshot> readSnapshot(const std::filesystem::path& path);

//! Write a snapshot. Returns false if the file cannot be written.
bool writeSnapshot(const DrawingSnapshot& snapshot, const std::filesystem::path& path);

/*! Apply a mutation batch to the snapshot markers. All or nothing.
 *  Every removal must target a marker that exists at that point of the batch. New markers get ids above the current maximum,
 *  in the same order the pass assigned its provisional ids.
 * \return false if any mutation is invalid. The snapshot is unchanged in that case.
 */
bool applyMutations(DrawingSnapshot& snapshot, const std::vector<MarkerMutation>& mutations);

} // namespace valvescan::matcher
