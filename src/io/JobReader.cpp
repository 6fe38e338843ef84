#include "massing/io/JobReader.h"
#include "massing/Errors.h"
#include "massing/params/ParameterLoader.h"
#include <SDL3/SDL_log.h>
#include <filesystem>

namespace massing {
namespace io {

using json = nlohmann::json;

geom::Point JobReader::parsePoint(const json& coord) {
    if (!coord.is_array() || coord.size() < 2 || !coord[0].is_number() || !coord[1].is_number()) {
        throw InvalidLotError("coordinate must be an [x, y] pair of numbers");
    }
    return geom::Point(coord[0].get<double>(), coord[1].get<double>());
}

lot::LotGeometry JobReader::parseLot(const json& lotDoc) {
    if (!lotDoc.contains("polygon") || !lotDoc["polygon"].is_array()) {
        throw InvalidLotError("lot has no polygon ring");
    }

    std::vector<geom::Point> ring;
    for (const auto& coord : lotDoc["polygon"]) {
        ring.push_back(parsePoint(coord));
    }

    if (!lotDoc.contains("faces") || lotDoc["faces"].is_null() || lotDoc["faces"].empty()) {
        return lot::LotGeometry::withInferredFaces(ring);
    }
    if (!lotDoc["faces"].is_array()) {
        throw InvalidLotError("faces must be a list");
    }

    std::vector<lot::BoundaryFace> faces;
    for (const auto& faceDoc : lotDoc["faces"]) {
        std::string roleStr = faceDoc.value("role", "");
        auto role = lot::parseFaceRole(roleStr);
        if (!role) {
            throw InvalidLotError("unknown face role '" + roleStr + "'");
        }

        if (!faceDoc.contains("coords") || !faceDoc["coords"].is_array() || faceDoc["coords"].size() != 2) {
            throw InvalidLotError("face coords must hold exactly two points");
        }
        faces.push_back(lot::BoundaryFace{parsePoint(faceDoc["coords"][0]),
                                          parsePoint(faceDoc["coords"][1]), *role});
    }

    return lot::LotGeometry(ring, std::move(faces));
}

std::optional<std::string> JobReader::defaultsPath(const json& job, const std::string& jobDir) {
    if (!job.is_object() || !job.contains("defaults") || !job["defaults"].is_string()) {
        return std::nullopt;
    }

    std::filesystem::path p(job["defaults"].get<std::string>());
    if (p.is_relative() && !jobDir.empty()) {
        p = std::filesystem::path(jobDir) / p;
    }
    return p.string();
}

std::vector<pipeline::LotJob> JobReader::fromJson(const json& job,
                                                  const json& defaults,
                                                  const json& overrides) {
    if (!job.is_object()) {
        throw ConfigError("job document must be an object");
    }
    if (!job.contains("lots") || !job["lots"].is_array()) {
        throw ConfigError("job document has no \"lots\" list");
    }

    json project = job.value("project", json::object());
    if (!project.is_object()) {
        throw ConfigError("\"project\" must be an object");
    }

    std::vector<pipeline::LotJob> jobs;
    const json& lots = job["lots"];
    jobs.reserve(lots.size());

    for (size_t i = 0; i < lots.size(); ++i) {
        const json& lotDoc = lots[i];
        pipeline::LotJob lotJob;
        lotJob.id = "lot_" + std::to_string(i + 1);

        try {
            if (!lotDoc.is_object()) {
                throw InvalidLotError("lot entry must be an object");
            }
            if (lotDoc.contains("id") && !lotDoc["id"].is_null()) {
                lotJob.id = lotDoc["id"].is_string() ? lotDoc["id"].get<std::string>() : lotDoc["id"].dump();
            }

            lotJob.lot = parseLot(lotDoc);

            json lotLayer = lotDoc.value("params", json::object());
            if (lotLayer.is_null()) lotLayer = json::object();
            if (!lotLayer.is_object()) {
                throw ParameterError("lot \"params\" must be an object");
            }
            // Command-line overrides sit above the lot layer
            lotJob.params = params::ParameterLoader::resolve(
                defaults, project, params::ParameterLoader::merge(lotLayer, overrides));
            SDL_LogDebug(SDL_LOG_CATEGORY_APPLICATION,
                         "Lot %s: max_height=%.2f max_far=%.2f mode=%s objective=%s", lotJob.id.c_str(),
                         lotJob.params->normative.maxHeight, lotJob.params->normative.maxFar,
                         params::modelingModeName(lotJob.params->strategy.mode),
                         params::objectiveName(lotJob.params->strategy.objective));
        } catch (const MassingError& e) {
            lotJob.inputError = e.what();
            lotJob.params.reset();
            SDL_LogWarn(SDL_LOG_CATEGORY_APPLICATION, "Lot %s: %s", lotJob.id.c_str(), e.what());
        } catch (const json::exception& e) {
            lotJob.inputError = e.what();
            lotJob.params.reset();
            SDL_LogWarn(SDL_LOG_CATEGORY_APPLICATION, "Lot %s: %s", lotJob.id.c_str(), e.what());
        }

        jobs.push_back(std::move(lotJob));
    }

    SDL_Log("JobReader: %zu lots read", jobs.size());
    return jobs;
}

} // namespace io
} // namespace massing
