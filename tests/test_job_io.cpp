#include <doctest/doctest.h>
#include "massing/Errors.h"
#include "massing/io/JobReader.h"
#include "massing/io/ResultWriter.h"
#include "test_helpers.h"
#include <algorithm>
#include <filesystem>
#include <sstream>

using namespace massing;
using namespace massing::io;
using json = nlohmann::json;

namespace {

json sampleJob() {
    return json::parse(R"({
        "project": {"normative_parameters": {"max_far": 2.5}},
        "lots": [
            {
                "id": "L-001",
                "polygon": [[0, 0], [25, 0], [25, 50], [0, 50], [0, 0]],
                "faces": [
                    {"role": "front", "coords": [[0, 0], [25, 0]]},
                    {"role": "side", "coords": [[25, 0], [25, 50]]},
                    {"role": "back", "coords": [[25, 50], [0, 50]]},
                    {"role": "side", "coords": [[0, 50], [0, 0]]}
                ],
                "params": {"normative_parameters": {"max_height": 13.0}}
            },
            {
                "polygon": [[100, 0], [130, 5], [128, 40], [98, 36], [100, 0]]
            },
            {
                "id": "bad-role",
                "polygon": [[0, 0], [10, 0], [10, 10], [0, 10], [0, 0]],
                "faces": [{"role": "roof", "coords": [[0, 0], [10, 0]]}]
            },
            {
                "id": 7,
                "polygon": [[0, 0], [25, 0], [25, 50], [0, 50], [0, 0]],
                "params": {"normative_parameters": {"uf_floor_height": -1}}
            }
        ]
    })");
}

json sampleDefaults() {
    return json::parse(R"({
        "normative_parameters": {"max_height": 60.0, "max_far": 2.0},
        "modeling_strategy": {"modeling_mode": "advanced"}
    })");
}

size_t countOf(const std::string& s, char c) {
    return static_cast<size_t>(std::count(s.begin(), s.end(), c));
}

std::vector<std::string> lines(const std::string& text) {
    std::vector<std::string> out;
    std::istringstream in(text);
    std::string line;
    while (std::getline(in, line)) out.push_back(line);
    return out;
}

} // namespace

TEST_SUITE("JobReader") {
    TEST_CASE("lots are resolved layer by layer") {
        json overrides = {{"modeling_strategy", {{"optimization_objective", "maximize_units"}}}};
        std::vector<pipeline::LotJob> jobs = JobReader::fromJson(sampleJob(), sampleDefaults(), overrides);
        REQUIRE(jobs.size() == 4);

        const pipeline::LotJob& first = jobs[0];
        CHECK(first.id == "L-001");
        CHECK(first.inputError.empty());
        REQUIRE(first.params.has_value());
        CHECK(first.params->normative.maxHeight == 13.0);
        CHECK(first.params->normative.maxFar == 2.5);
        CHECK(first.params->strategy.objective == params::Objective::MaximizeUnits);
        CHECK(first.lot.edgeRole(0) == lot::FaceRole::Front);
        CHECK(first.lot.edgeRole(2) == lot::FaceRole::Back);

        const pipeline::LotJob& second = jobs[1];
        CHECK(second.id == "lot_2");
        REQUIRE(second.params.has_value());
        CHECK(second.params->normative.maxHeight == 60.0);
        CHECK_NOTHROW(second.lot.validate());
    }

    TEST_CASE("a bad lot keeps its error and the rest of the batch") {
        std::vector<pipeline::LotJob> jobs = JobReader::fromJson(sampleJob(), sampleDefaults());
        REQUIRE(jobs.size() == 4);

        CHECK(jobs[2].id == "bad-role");
        CHECK_FALSE(jobs[2].params.has_value());
        CHECK(jobs[2].inputError.find("roof") != std::string::npos);

        CHECK(jobs[3].id == "7");
        CHECK_FALSE(jobs[3].params.has_value());
        CHECK(jobs[3].inputError.find("uf_floor_height") != std::string::npos);
    }

    TEST_CASE("job level problems throw") {
        CHECK_THROWS_AS(JobReader::fromJson(json::array(), sampleDefaults()), ConfigError);
        CHECK_THROWS_AS(JobReader::fromJson(json::object(), sampleDefaults()), ConfigError);
        CHECK_THROWS_AS(JobReader::fromJson(json::parse(R"({"lots": [], "project": 3})"), sampleDefaults()),
                        ConfigError);
    }

    TEST_CASE("cadastral role names") {
        json lotDoc = json::parse(R"({
            "polygon": [[0, 100], [20, 100], [20, 108], [0, 108], [0, 100]],
            "faces": [
                {"role": "frente", "coords": [[0, 100], [20, 100]]},
                {"role": "lateral", "coords": [[20, 100], [20, 108]]},
                {"role": "fundos", "coords": [[20, 108], [0, 108]]},
                {"role": "lateral", "coords": [[0, 108], [0, 100]]}
            ]
        })");
        lot::LotGeometry lot = JobReader::parseLot(lotDoc);
        CHECK(lot.faces().size() == 4);
        CHECK_NOTHROW(lot.validate());
        CHECK(lot.edgeRole(0) == lot::FaceRole::Front);
        CHECK(lot.edgeRole(2) == lot::FaceRole::Back);
    }

    TEST_CASE("malformed coordinates") {
        CHECK_THROWS_AS(JobReader::parseLot(json::object()), InvalidLotError);
        CHECK_THROWS_AS(JobReader::parseLot(json::parse(R"({"polygon": [[0, 0], [1]]})")), InvalidLotError);
        CHECK_THROWS_AS(JobReader::parseLot(json::parse(R"({"polygon": [[0, 0], ["a", 1]]})")), InvalidLotError);
        CHECK_THROWS_AS(JobReader::parseLot(json::parse(R"({"polygon": [[0, 0], [1, 0], [1, 1], [0, 0]],
                                                            "faces": [{"role": "front", "coords": [[0, 0]]}]})")),
                        InvalidLotError);
    }

    TEST_CASE("defaults path is relative to the job") {
        json job = {{"defaults", "../config/default.json"}, {"lots", json::array()}};
        auto path = JobReader::defaultsPath(job, "data");
        REQUIRE(path.has_value());
        CHECK(std::filesystem::path(*path) == std::filesystem::path("data") / "../config/default.json");

        CHECK_FALSE(JobReader::defaultsPath(json{{"lots", json::array()}}, "data").has_value());
    }
}

TEST_SUITE("ResultWriter") {
    TEST_CASE("floors as GeoJSON") {
        auto p = testing::exampleParameters();
        p.normative.maxHeight = 13.0;
        p.normative.maxFar = 2.5;
        pipeline::LotResult r = pipeline::LotEvaluator().evaluate("L1", testing::exampleLot(), p);
        REQUIRE(r.best.has_value());

        json baseline = ResultWriter::floorsToGeoJson(r, r.baseline, false);
        CHECK(baseline["type"] == "FeatureCollection");
        REQUIRE(baseline["features"].size() == 4);
        CHECK(baseline["properties"]["stack"] == "baseline");
        CHECK(baseline["properties"]["termination"] == "height_cap");
        CHECK(baseline["properties"]["parking_levels"].size() == r.baseline.parking.levels.size());

        const json& ground = baseline["features"][0];
        CHECK(ground["geometry"]["type"] == "Polygon");
        const json& ring = ground["geometry"]["coordinates"][0];
        REQUIRE(ring.size() == 5);
        CHECK(ring[0] == ring[4]);
        CHECK(ground["properties"]["lot_id"] == "L1");
        CHECK(ground["properties"]["floor_label"] == "Ground");
        CHECK(ground["properties"]["area"].get<double>() == doctest::Approx(924.0));
        CHECK_FALSE(ground["properties"].contains("shape_variant"));

        json best = ResultWriter::floorsToGeoJson(r, *r.best, true);
        CHECK(best["properties"]["stack"] == "best_shape");
        CHECK(best["features"][0]["properties"]["shape_variant"] == "r0.5_o0");
    }

    TEST_CASE("summary table") {
        auto p = testing::exampleParameters();
        p.normative.maxHeight = 13.0;
        p.normative.maxFar = 2.5;

        std::vector<pipeline::LotResult> results;
        results.push_back(pipeline::LotEvaluator().evaluate("L1", testing::exampleLot(), p));
        results.push_back(pipeline::LotResult::invalidInput("L2", "unknown face role 'x', at face 1"));

        std::vector<std::string> rows = lines(ResultWriter::summaryCsv(results));
        REQUIRE(rows.size() == 3);
        CHECK(rows[0].rfind("lot_id,status,message,objective,objective_value,best_shape,", 0) == 0);
        CHECK(countOf(rows[0], ',') == 23);

        CHECK(rows[1].rfind("L1,ok,,maximize_far_within_height,2.2176,r0.5_o0,4,3696.00,", 0) == 0);
        CHECK(countOf(rows[1], ',') == 23);

        // Quoted message keeps its comma out of the column count
        CHECK(rows[2].rfind("L2,invalid_input,\"unknown face role 'x', at face 1\",", 0) == 0);
        CHECK(countOf(rows[2], ',') == 24);
    }

    TEST_CASE("distinct lot ids get distinct file stems") {
        CHECK(ResultWriter::fileStem("L1") == "L1");
        CHECK(ResultWriter::fileStem("lot_2.a-b") == "lot_2.a-b");

        std::string slash = ResultWriter::fileStem("a/b");
        CHECK(slash.rfind("a_b_", 0) == 0);
        CHECK(slash != ResultWriter::fileStem("a_b"));
        CHECK(slash != ResultWriter::fileStem("a b"));
        CHECK(slash == ResultWriter::fileStem("a/b"));
        CHECK(ResultWriter::fileStem("").rfind("lot_", 0) == 0);
    }

    TEST_CASE("shape ids keep every significant digit") {
        using building::ShapeVariant;
        CHECK(ShapeVariant::orthogonal().id() == "orthogonal");
        CHECK(ShapeVariant::compositeShape(0.5, 90.0).id() == "r0.5_o90");
        CHECK(ShapeVariant::compositeShape(0.333, 0.0).id() != ShapeVariant::compositeShape(0.334, 0.0).id());
        CHECK(ShapeVariant::compositeShape(0.333, 22.5).id() == "r0.333_o22.5");
    }

    TEST_CASE("files for a finished lot") {
        auto p = testing::exampleParameters();
        p.normative.maxHeight = 13.0;
        p.normative.maxFar = 2.5;
        pipeline::LotResult ok = pipeline::LotEvaluator().evaluate("L/1", testing::exampleLot(), p);
        pipeline::LotResult tiny = pipeline::LotEvaluator().evaluate("tiny", lot::LotGeometry::rectangle(25, 7), p);

        std::filesystem::path dir = std::filesystem::temp_directory_path() / "massing_result_writer_test";
        std::filesystem::remove_all(dir);

        ResultWriter writer(dir.string());
        CHECK(writer.writeLot(ok));
        CHECK(writer.writeLot(tiny));
        CHECK(writer.writeSummary({ok, tiny}));

        std::string stem = ResultWriter::fileStem("L/1");
        CHECK(std::filesystem::exists(dir / (stem + "_baseline.geojson")));
        CHECK(std::filesystem::exists(dir / (stem + "_best_shape.geojson")));
        CHECK_FALSE(std::filesystem::exists(dir / "tiny_baseline.geojson"));
        CHECK(std::filesystem::exists(dir / "summary.csv"));

        std::filesystem::remove_all(dir);
    }
}
