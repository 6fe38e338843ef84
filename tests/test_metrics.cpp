#include <doctest/doctest.h>
#include "massing/building/FloorStackBuilder.h"
#include "massing/metrics/MetricsAggregator.h"
#include "test_helpers.h"

using namespace massing;
using namespace massing::metrics;

namespace {

params::ParameterSet fourFloorParameters() {
    auto p = testing::exampleParameters();
    p.normative.maxHeight = 13.0;
    p.normative.maxFar = 3.0;
    p.normative.maxLotCoverage = 0.8;
    return p;
}

bool hasViolation(const SummaryMetrics& m, ViolationKind kind) {
    for (const auto& v : m.violations) {
        if (v.kind == kind) return true;
    }
    return false;
}

} // namespace

TEST_SUITE("MetricsAggregator") {
    TEST_CASE("summary of a compliant stack") {
        auto p = fourFloorParameters();
        auto lot = testing::exampleLot();
        building::FloorStack stack = building::FloorStackBuilder(lot, p).build();
        parking::ParkingPlan plan = parking::ParkingAllocator(p, lot.area()).allocate(stack);

        SummaryMetrics m = MetricsAggregator(p).summarize(stack, plan, lot);

        CHECK(m.lotArea == doctest::Approx(1250.0));
        CHECK(m.grossFloorArea == doctest::Approx(3696.0));
        CHECK(m.farArea == doctest::Approx(3696.0));
        CHECK(m.far == doctest::Approx(3696.0 / 1250.0));
        CHECK(m.estimatedUnits == 48);
        CHECK(m.floorCount == 4);
        CHECK(m.totalHeight == doctest::Approx(13.0));
        CHECK(m.coverage == doctest::Approx(924.0 / 1250.0));
        CHECK(m.slenderness == doctest::Approx(13.0 / 22.0));
        CHECK(m.parkingStallsRequired == 48);
        CHECK(m.parkingStallsProvided == 48);
        CHECK(m.parkingAreaRequired == doctest::Approx(1320.0));
        CHECK_FALSE(m.parkingShortfall);
        CHECK(m.compliant());
    }

    TEST_CASE("efficiency against the target") {
        auto p = fourFloorParameters();
        auto lot = testing::exampleLot();
        building::FloorStack stack = building::FloorStackBuilder(lot, p).build();
        parking::ParkingPlan plan = parking::ParkingAllocator(p, lot.area()).allocate(stack);

        // 735 usable of 924 gross
        SummaryMetrics m = MetricsAggregator(p).summarize(stack, plan, lot);
        CHECK(m.efficiency == doctest::Approx(735.0 / 924.0));
        CHECK_FALSE(m.meetsTargetEfficiency);

        p.architectural.targetEfficiency = 0.75;
        CHECK(MetricsAggregator(p).summarize(stack, plan, lot).meetsTargetEfficiency);
    }

    TEST_CASE("limits are reported, never enforced") {
        auto built = testing::exampleParameters();
        auto lot = testing::exampleLot();
        building::FloorStack stack = building::FloorStackBuilder(lot, built).build();
        parking::ParkingPlan plan = parking::ParkingAllocator(built, lot.area()).allocate(stack);

        auto strict = fourFloorParameters();
        strict.normative.maxLotCoverage = 0.6;
        SummaryMetrics m = MetricsAggregator(strict).summarize(stack, plan, lot);

        CHECK(m.floorCount == 14);
        CHECK(hasViolation(m, ViolationKind::Height));
        CHECK(hasViolation(m, ViolationKind::Far));
        CHECK(hasViolation(m, ViolationKind::Coverage));
        CHECK(hasViolation(m, ViolationKind::ParkingShortfall));
        CHECK_FALSE(m.compliant());
    }

    TEST_CASE("parking counted toward FAR") {
        auto p = fourFloorParameters();
        p.strategy.includeParkingInFar = true;
        auto lot = testing::exampleLot();
        building::FloorStack stack = building::FloorStackBuilder(lot, p).build();
        parking::ParkingPlan plan = parking::ParkingAllocator(p, lot.area()).allocate(stack);

        SummaryMetrics m = MetricsAggregator(p).summarize(stack, plan, lot);
        CHECK(m.farArea == doctest::Approx(3696.0 + 1320.0));
        CHECK(m.far == doctest::Approx(5016.0 / 1250.0));
        CHECK(hasViolation(m, ViolationKind::Far));
    }

    TEST_CASE("empty stack") {
        auto p = fourFloorParameters();
        auto lot = testing::exampleLot();
        building::FloorStack stack;
        parking::ParkingPlan plan = parking::ParkingAllocator(p, lot.area()).allocate(stack);

        SummaryMetrics m = MetricsAggregator(p).summarize(stack, plan, lot);
        CHECK(m.far == 0.0);
        CHECK(m.coverage == 0.0);
        CHECK(m.floorCount == 0);
        CHECK_FALSE(m.meetsTargetEfficiency);
        CHECK(m.compliant());
    }

    TEST_CASE("violation names") {
        CHECK(std::string(violationKindName(ViolationKind::Far)) == "far");
        CHECK(std::string(violationKindName(ViolationKind::ParkingShortfall)) == "parking_shortfall");
    }
}
