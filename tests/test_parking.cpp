#include <doctest/doctest.h>
#include "massing/building/FloorStackBuilder.h"
#include "massing/parking/ParkingAllocator.h"
#include "test_helpers.h"

using namespace massing;
using namespace massing::parking;

namespace {

// Four 22 x 42 m floors, 12 units each
building::FloorStack fourFloorStack(const params::ParameterSet& base) {
    auto p = base;
    p.normative.maxHeight = 13.0;
    auto lot = testing::exampleLot();
    return building::FloorStackBuilder(lot, p).build();
}

} // namespace

TEST_SUITE("ParkingAllocator") {
    TEST_CASE("stall demand") {
        params::ParkingParameters parking;
        CHECK(ParkingAllocator::requiredStalls(0, parking) == 0);
        CHECK(ParkingAllocator::requiredStalls(48, parking) == 48);

        parking.ratioResidential = 1.5;
        CHECK(ParkingAllocator::requiredStalls(5, parking) == 8);

        parking.ratioResidential = 1.0;
        parking.commercialArea = 250.0;
        // 10 + 250 / 100 * 0.5 = 11.25
        CHECK(ParkingAllocator::requiredStalls(10, parking) == 12);
    }

    TEST_CASE("underground parking fills levels below ground") {
        auto p = testing::exampleParameters();
        building::FloorStack stack = fourFloorStack(p);
        REQUIRE(stack.estimatedUnits(p.architectural.targetUnitArea) == 48);

        ParkingPlan plan = ParkingAllocator(p, 1250.0).allocate(stack);

        CHECK(plan.required);
        CHECK(plan.residentialUnits == 48);
        CHECK(plan.stallsRequired == 48);
        CHECK(plan.areaRequired == doctest::Approx(48 * 27.5));
        CHECK(plan.capacity == doctest::Approx(2500.0));

        REQUIRE(plan.levels.size() == 2);
        CHECK(plan.levels[0].level == -1);
        CHECK(plan.levels[0].area == doctest::Approx(1250.0));
        CHECK(plan.levels[0].baseElevation == doctest::Approx(-3.0));
        CHECK(plan.levels[1].level == -2);
        CHECK(plan.levels[1].area == doctest::Approx(70.0));
        CHECK(plan.levels[1].baseElevation == doctest::Approx(-6.0));

        CHECK(plan.areaProvided == doctest::Approx(1320.0));
        CHECK(plan.stallsProvided == 48);
        CHECK_FALSE(plan.shortfall);
        CHECK(plan.farArea() == 0.0);
    }

    TEST_CASE("demand beyond the allowed levels is a shortfall") {
        auto p = testing::exampleParameters();
        p.parking.levelsAllowed = 1;
        building::FloorStack stack = fourFloorStack(p);

        ParkingPlan plan = ParkingAllocator(p, 1250.0).allocate(stack);

        REQUIRE(plan.levels.size() == 1);
        CHECK(plan.areaProvided == doctest::Approx(1250.0));
        CHECK(plan.stallsProvided == 45);
        CHECK(plan.shortfall);
        CHECK(plan.shortfallArea == doctest::Approx(70.0));
    }

    TEST_CASE("shortfall is logged against the lot") {
        auto p = testing::exampleParameters();
        p.parking.levelsAllowed = 1;
        building::FloorStack stack = fourFloorStack(p);

        ParkingAllocator allocator(p, 1250.0);
        allocator.setLotId("L-9");
        testing::LogCapture log;
        CHECK(allocator.allocate(stack).shortfall);
        CHECK(log.contains("Lot L-9: 48 stalls need 1320.0 m2"));
    }

    TEST_CASE("surface parking uses the lot left by the ground floor") {
        auto p = testing::exampleParameters();
        p.parking.type = params::ParkingType::Surface;
        building::FloorStack stack = fourFloorStack(p);

        ParkingPlan plan = ParkingAllocator(p, 1250.0).allocate(stack);

        CHECK(plan.capacity == doctest::Approx(1250.0 - 924.0));
        REQUIRE(plan.levels.size() == 1);
        CHECK(plan.levels[0].level == 0);
        CHECK(plan.levels[0].baseElevation == 0.0);
        CHECK(plan.areaProvided == doctest::Approx(326.0));
        CHECK(plan.stallsProvided == 11);
        CHECK(plan.shortfall);
        CHECK(plan.shortfallArea == doctest::Approx(1320.0 - 326.0));
    }

    TEST_CASE("parking not required") {
        auto p = testing::exampleParameters();
        p.parking.required = false;
        building::FloorStack stack = fourFloorStack(p);

        ParkingPlan plan = ParkingAllocator(p, 1250.0).allocate(stack);
        CHECK_FALSE(plan.required);
        CHECK(plan.residentialUnits == 48);
        CHECK(plan.stallsRequired == 0);
        CHECK(plan.levels.empty());
        CHECK_FALSE(plan.shortfall);
    }

    TEST_CASE("parking area can count toward FAR") {
        auto p = testing::exampleParameters();
        p.strategy.includeParkingInFar = true;
        building::FloorStack stack = fourFloorStack(p);

        ParkingPlan plan = ParkingAllocator(p, 1250.0).allocate(stack);
        CHECK(plan.countsTowardFar);
        CHECK(plan.farArea() == doctest::Approx(1320.0));
    }

    TEST_CASE("empty stack needs no parking") {
        auto p = testing::exampleParameters();
        ParkingPlan plan = ParkingAllocator(p, 1250.0).allocate(building::FloorStack());
        CHECK(plan.stallsRequired == 0);
        CHECK(plan.levels.empty());
        CHECK_FALSE(plan.shortfall);
    }
}
