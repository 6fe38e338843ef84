#pragma once

#include "massing/pipeline/LotEvaluator.h"
#include <nlohmann/json.hpp>
#include <string>
#include <vector>

namespace massing {
namespace io {

/**
 * ResultWriter - floor geometry and the cross-lot summary table.
 *
 * For each lot: <stem>_baseline.geojson and, when a shape was selected,
 * <stem>_best_shape.geojson, each a FeatureCollection with one Polygon
 * feature per floor. Across lots: summary.csv.
 */
class ResultWriter {
public:
    using json = nlohmann::json;

    explicit ResultWriter(std::string outputDir);

    // Floors of one stack as a GeoJSON FeatureCollection
    static json floorsToGeoJson(const pipeline::LotResult& result,
                                const pipeline::StackOutcome& outcome,
                                bool bestShape);

    /**
     * File name stem of a lot. Ids made of [A-Za-z0-9._-] are used as is;
     * any other character becomes '_' and a hash of the raw id is appended,
     * so distinct ids never share a file.
     */
    static std::string fileStem(const std::string& lotId);

    // Header plus one row per lot
    static std::string summaryCsv(const std::vector<pipeline::LotResult>& results);

    // Returns false (after logging) when a file cannot be written
    bool writeLot(const pipeline::LotResult& result) const;
    bool writeSummary(const std::vector<pipeline::LotResult>& results) const;

private:
    bool ensureOutputDir() const;
    bool writeText(const std::string& path, const std::string& content) const;

    std::string outputDir_;
};

} // namespace io
} // namespace massing
