#pragma once

#include "massing/lot/LotGeometry.h"
#include "massing/pipeline/BatchRunner.h"
#include <nlohmann/json.hpp>
#include <optional>
#include <string>
#include <vector>

namespace massing {
namespace io {

/**
 * JobReader - turns a job document into resolved lot jobs.
 *
 * {
 *   "defaults": "config/default.json",          optional, relative to the job file
 *   "project":  { ...parameter overrides... },   optional
 *   "lots": [
 *     { "id": "L1",
 *       "polygon": [[0,0],[25,0],[25,50],[0,50],[0,0]],
 *       "faces": [{"role": "front", "coords": [[0,0],[25,0]]}, ...],   optional
 *       "params": { ...parameter overrides... } }                      optional
 *   ]
 * }
 *
 * Problems with the job as a whole throw ConfigError. Problems with a single
 * lot (bad polygon, unknown face role, invalid parameters) are stored on
 * that lot's LotJob so the rest of the batch still runs.
 */
class JobReader {
public:
    using json = nlohmann::json;

    /**
     * @param job Parsed job document
     * @param defaults Default parameter document (lowest layer)
     * @param overrides Applied above the lot layer (command-line switches)
     */
    static std::vector<pipeline::LotJob> fromJson(const json& job,
                                                  const json& defaults,
                                                  const json& overrides = json::object());

    // Path named by "defaults", resolved against `jobDir`; nullopt if absent
    static std::optional<std::string> defaultsPath(const json& job, const std::string& jobDir);

    // Polygon and faces of one lot entry; throws InvalidLotError
    static lot::LotGeometry parseLot(const json& lotDoc);

private:
    static geom::Point parsePoint(const json& coord);
};

} // namespace io
} // namespace massing
