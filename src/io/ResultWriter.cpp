#include "massing/io/ResultWriter.h"
#include <SDL3/SDL_log.h>
#include <cstdint>
#include <cstdio>
#include <filesystem>
#include <fstream>
#include <sstream>

namespace massing {
namespace io {

using json = nlohmann::json;

namespace {

std::string csvField(const std::string& s) {
    if (s.find_first_of(",\"\n") == std::string::npos) return s;

    std::string out = "\"";
    for (char c : s) {
        if (c == '"') out += "\"\"";
        else out += c;
    }
    out += "\"";
    return out;
}

std::string fixed(double v, int decimals) {
    char buf[64];
    std::snprintf(buf, sizeof(buf), "%.*f", decimals, v);
    return buf;
}

json ringToJson(const geom::Polygon& poly) {
    json ring = json::array();
    for (const auto& v : poly.vertices()) {
        ring.push_back({v.x, v.y});
    }
    if (!poly.empty()) {
        ring.push_back({poly[0].x, poly[0].y});
    }
    return json::array({ring});
}

void appendStackColumns(std::ostringstream& row, const pipeline::StackOutcome* o) {
    if (!o) {
        row << ",,,,,,,,,";
        return;
    }
    const metrics::SummaryMetrics& m = o->metrics;
    row << ',' << m.floorCount
        << ',' << fixed(m.grossFloorArea, 2)
        << ',' << fixed(m.far, 4)
        << ',' << m.estimatedUnits
        << ',' << m.parkingStallsRequired
        << ',' << m.parkingStallsProvided
        << ',' << fixed(m.parkingAreaRequired, 2)
        << ',' << fixed(m.parkingAreaProvided, 2)
        << ',' << (m.compliant() ? "true" : "false");
}

} // namespace

std::string ResultWriter::fileStem(const std::string& lotId) {
    std::string out;
    bool replaced = lotId.empty();
    for (char c : lotId) {
        bool ok = (c >= 'a' && c <= 'z') || (c >= 'A' && c <= 'Z') || (c >= '0' && c <= '9') ||
                  c == '-' || c == '_' || c == '.';
        out += ok ? c : '_';
        replaced = replaced || !ok;
    }
    if (!replaced) return out;

    // FNV-1a of the raw id keeps "a/b" apart from "a_b"
    uint32_t hash = 2166136261u;
    for (char c : lotId) {
        hash ^= static_cast<unsigned char>(c);
        hash *= 16777619u;
    }
    char suffix[16];
    std::snprintf(suffix, sizeof(suffix), "%08x", static_cast<unsigned>(hash));
    return (out.empty() ? std::string("lot") : out) + "_" + suffix;
}

ResultWriter::ResultWriter(std::string outputDir)
    : outputDir_(std::move(outputDir)) {}

json ResultWriter::floorsToGeoJson(const pipeline::LotResult& result,
                                   const pipeline::StackOutcome& outcome,
                                   bool bestShape) {
    json features = json::array();

    for (const auto& floor : outcome.stack.floors) {
        json props;
        props["lot_id"] = result.lotId;
        props["floor_index"] = floor.index;
        props["floor_label"] = floor.label;
        props["base_elevation"] = floor.baseElevation;
        props["floor_height"] = floor.floorHeight;
        props["top_elevation"] = floor.topElevation();
        props["area"] = floor.area;
        props["usable_area"] = floor.usableArea;
        props["has_setback"] = floor.hasSetback;
        props["back_setback"] = floor.setbacks.back;
        if (bestShape) {
            props["shape_variant"] = floor.shape ? floor.shape->id() : "orthogonal";
        }

        json feature;
        feature["type"] = "Feature";
        feature["properties"] = props;
        feature["geometry"] = {{"type", "Polygon"}, {"coordinates", ringToJson(floor.footprint)}};
        features.push_back(feature);
    }

    json parkingLevels = json::array();
    for (const auto& level : outcome.parking.levels) {
        parkingLevels.push_back({{"level", level.level},
                                 {"area", level.area},
                                 {"base_elevation", level.baseElevation}});
    }

    json collection;
    collection["type"] = "FeatureCollection";
    collection["features"] = features;
    collection["properties"] = {
        {"lot_id", result.lotId},
        {"stack", bestShape ? "best_shape" : "baseline"},
        {"termination", building::terminationName(outcome.stack.termination)},
        {"parking_type", params::parkingTypeName(outcome.parking.type)},
        {"parking_levels", parkingLevels}
    };
    return collection;
}

std::string ResultWriter::summaryCsv(const std::vector<pipeline::LotResult>& results) {
    std::ostringstream out;
    out << "lot_id,status,message,objective,objective_value,best_shape,"
           "baseline_floors,baseline_gfa,baseline_far,baseline_units,"
           "baseline_parking_required,baseline_parking_provided,"
           "baseline_parking_area_required,baseline_parking_area_provided,baseline_compliant,"
           "best_floors,best_gfa,best_far,best_units,"
           "best_parking_required,best_parking_provided,"
           "best_parking_area_required,best_parking_area_provided,best_compliant\n";

    for (const auto& r : results) {
        std::ostringstream row;
        row << csvField(r.lotId)
            << ',' << pipeline::lotStatusName(r.status)
            << ',' << csvField(r.message)
            << ',' << params::objectiveName(r.objective)
            << ',' << (r.objectiveValue ? fixed(*r.objectiveValue, 4) : "")
            << ',' << (r.bestCandidate ? r.bestCandidate->shape.id() : "");

        bool evaluated = r.status == pipeline::LotStatus::Ok || r.status == pipeline::LotStatus::Infeasible;
        appendStackColumns(row, evaluated ? &r.baseline : nullptr);
        appendStackColumns(row, r.best ? &*r.best : nullptr);
        out << row.str() << '\n';
    }
    return out.str();
}

bool ResultWriter::ensureOutputDir() const {
    std::error_code ec;
    std::filesystem::create_directories(outputDir_, ec);
    if (ec) {
        SDL_LogError(SDL_LOG_CATEGORY_APPLICATION, "Failed to create %s: %s",
                     outputDir_.c_str(), ec.message().c_str());
        return false;
    }
    return true;
}

bool ResultWriter::writeText(const std::string& path, const std::string& content) const {
    std::ofstream file(path);
    if (!file) {
        SDL_LogError(SDL_LOG_CATEGORY_APPLICATION, "Failed to write %s", path.c_str());
        return false;
    }
    file << content;
    return true;
}

bool ResultWriter::writeLot(const pipeline::LotResult& result) const {
    if (result.status != pipeline::LotStatus::Ok) {
        return true;
    }

    if (!ensureOutputDir()) return false;
    std::string base = outputDir_ + "/" + fileStem(result.lotId);

    bool ok = writeText(base + "_baseline.geojson",
                        floorsToGeoJson(result, result.baseline, false).dump(2));
    if (result.best) {
        ok = writeText(base + "_best_shape.geojson",
                       floorsToGeoJson(result, *result.best, true).dump(2)) && ok;
    }
    return ok;
}

bool ResultWriter::writeSummary(const std::vector<pipeline::LotResult>& results) const {
    if (!ensureOutputDir()) return false;
    std::string path = outputDir_ + "/summary.csv";
    if (!writeText(path, summaryCsv(results))) {
        return false;
    }
    SDL_Log("Saved summary of %zu lots to %s", results.size(), path.c_str());
    return true;
}

} // namespace io
} // namespace massing
