#include <doctest/doctest.h>
#include "massing/pipeline/BatchRunner.h"
#include "test_helpers.h"

using namespace massing;
using namespace massing::pipeline;

namespace {

params::ParameterSet cappedFarParameters() {
    auto p = testing::exampleParameters();
    p.normative.maxHeight = 13.0;
    p.normative.maxFar = 2.5;
    return p;
}

LotJob validJob(const std::string& id) {
    LotJob job;
    job.id = id;
    job.lot = testing::exampleLot();
    job.params = cappedFarParameters();
    return job;
}

const LotResult* find(const std::vector<LotResult>& results, const std::string& id) {
    for (const auto& r : results) {
        if (r.lotId == id) return &r;
    }
    return nullptr;
}

} // namespace

TEST_SUITE("LotEvaluator") {
    TEST_CASE("feasible lot gets a baseline and a best shape") {
        LotEvaluator evaluator;
        LotResult r = evaluator.evaluate("L1", testing::exampleLot(), cappedFarParameters());

        CHECK(r.status == LotStatus::Ok);
        CHECK(r.message.empty());
        CHECK(r.baseline.metrics.floorCount == 4);
        CHECK(r.baseline.metrics.grossFloorArea == doctest::Approx(3696.0));
        CHECK(r.trace.size() == 12);

        REQUIRE(r.bestCandidate.has_value());
        REQUIRE(r.best.has_value());
        CHECK(r.bestCandidate->shape == building::ShapeVariant::compositeShape(0.5, 0.0));
        REQUIRE(r.objectiveValue.has_value());
        CHECK(*r.objectiveValue == doctest::Approx(2772.0 / 1250.0));
        CHECK(r.best->metrics.grossFloorArea == doctest::Approx(2772.0));
        CHECK(r.best->parking.stallsRequired == r.best->metrics.estimatedUnits);
    }

    TEST_CASE("baseline only when no candidate is selectable") {
        auto p = cappedFarParameters();
        p.strategy.mode = params::ModelingMode::Basic;

        LotResult r = LotEvaluator().evaluate("L1", testing::exampleLot(), p);
        CHECK(r.status == LotStatus::Ok);
        CHECK(r.baseline.metrics.floorCount == 4);
        CHECK_FALSE(r.best.has_value());
        CHECK_FALSE(r.objectiveValue.has_value());
        CHECK_FALSE(r.message.empty());
    }

    TEST_CASE("lot with no buildable floor is infeasible") {
        LotResult r = LotEvaluator().evaluate("tiny", lot::LotGeometry::rectangle(25.0, 7.0),
                                              cappedFarParameters());
        CHECK(r.status == LotStatus::Infeasible);
        CHECK(r.baseline.stack.empty());
        CHECK(r.message == "no floor fits: empty");
        CHECK(r.trace.empty());
        CHECK_FALSE(r.best.has_value());
    }

    TEST_CASE("invalid lot is reported, not thrown") {
        // Ring not closed
        std::vector<geom::Point> ring = {{0, 0}, {25, 0}, {25, 50}, {0, 50}};
        lot::LotGeometry open(ring, {});

        LotResult r = LotEvaluator().evaluate("open", open, cappedFarParameters());
        CHECK(r.status == LotStatus::InvalidInput);
        CHECK_FALSE(r.message.empty());
    }

    TEST_CASE("invalid parameters are reported, not thrown") {
        auto p = cappedFarParameters();
        p.normative.ufFloorHeight = 0.0;

        LotResult r = LotEvaluator().evaluate("L1", testing::exampleLot(), p);
        CHECK(r.status == LotStatus::InvalidInput);
    }

    TEST_CASE("cancelled before start") {
        CancellationToken cancel;
        cancel.cancel();

        LotResult r = LotEvaluator().evaluate("L1", testing::exampleLot(), cappedFarParameters(), &cancel);
        CHECK(r.status == LotStatus::Cancelled);
    }
}

TEST_SUITE("ResultCollector") {
    TEST_CASE("at most one result per lot") {
        ResultCollector collector;
        CHECK(collector.commit(LotResult::invalidInput("A", "first")));
        CHECK_FALSE(collector.commit(LotResult::invalidInput("A", "second")));
        CHECK(collector.commit(LotResult::invalidInput("B", "other")));

        CHECK(collector.size() == 2);
        CHECK(collector.contains("A"));
        CHECK_FALSE(collector.contains("C"));
        CHECK(collector.results()[0].message == "first");
    }
}

TEST_SUITE("BatchRunner") {
    TEST_CASE("one bad lot does not stop the batch") {
        std::vector<LotJob> jobs;
        jobs.push_back(validJob("good"));

        LotJob broken;
        broken.id = "broken";
        broken.inputError = "unknown face role 'x'";
        jobs.push_back(broken);

        LotJob tiny = validJob("tiny");
        tiny.lot = lot::LotGeometry::rectangle(25.0, 7.0);
        jobs.push_back(tiny);

        ResultCollector collector;
        size_t committed = BatchRunner().run(jobs, collector);
        CHECK(committed == 3);

        std::vector<LotResult> results = collector.results();
        REQUIRE(find(results, "good"));
        REQUIRE(find(results, "broken"));
        REQUIRE(find(results, "tiny"));
        CHECK(find(results, "good")->status == LotStatus::Ok);
        CHECK(find(results, "broken")->status == LotStatus::InvalidInput);
        CHECK(find(results, "broken")->message == "unknown face role 'x'");
        CHECK(find(results, "tiny")->status == LotStatus::Infeasible);
    }

    TEST_CASE("lots evaluated side by side match a single-lot run") {
        std::vector<LotJob> jobs = {validJob("A"), validJob("B"), validJob("C")};

        ResultCollector collector;
        BatchRunner().run(jobs, collector);

        LotResult single = LotEvaluator().evaluate("A", testing::exampleLot(), cappedFarParameters());
        for (const auto& r : collector.results()) {
            REQUIRE(r.best.has_value());
            CHECK(r.bestCandidate->shape == single.bestCandidate->shape);
            CHECK(r.best->stack == single.best->stack);
        }
    }

    TEST_CASE("duplicate lot ids commit once") {
        std::vector<LotJob> jobs = {validJob("same"), validJob("same")};

        ResultCollector collector;
        size_t committed = BatchRunner().run(jobs, collector);
        CHECK(committed == 1);
        CHECK(collector.size() == 1);
    }

    TEST_CASE("cancelled batch starts no lots") {
        std::vector<LotJob> jobs = {validJob("A"), validJob("B")};
        CancellationToken cancel;
        cancel.cancel();

        ResultCollector collector;
        CHECK(BatchRunner().run(jobs, collector, &cancel) == 0);
        CHECK(collector.size() == 0);
    }

    TEST_CASE("missing parameters count as invalid input") {
        LotJob job;
        job.id = "bare";
        job.lot = testing::exampleLot();

        ResultCollector collector;
        BatchRunner().run({job}, collector);
        REQUIRE(collector.size() == 1);
        CHECK(collector.results()[0].status == LotStatus::InvalidInput);
    }
}
