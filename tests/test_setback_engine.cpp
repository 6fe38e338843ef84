#include <doctest/doctest.h>
#include "massing/building/SetbackEngine.h"
#include "test_helpers.h"

using namespace massing;
using namespace massing::building;

TEST_SUITE("SetbackEngine") {
    TEST_CASE("front and side stay at their minimums") {
        SetbackEngine engine(testing::exampleParameters().normative);

        for (int floor = 1; floor <= 20; ++floor) {
            SetbackOffsets o = engine.offsets(floor, engine.heightBelow(floor));
            CHECK(o.front == 5.0);
            CHECK(o.side == 1.5);
        }
    }

    TEST_CASE("back offset is the minimum below the start floor") {
        auto p = testing::exampleParameters();
        p.normative.backSetbackPercent = 0.9;
        SetbackEngine engine(p.normative);

        for (int floor = 1; floor < p.normative.minSetbackStartFloor; ++floor) {
            SetbackOffsets o = engine.offsets(floor, engine.heightBelow(floor));
            CHECK(o.back == p.normative.minBackSetback);
            CHECK_FALSE(o.backEscalated);
        }
    }

    TEST_CASE("back offset follows the percentage of the height below") {
        SetbackEngine engine(testing::exampleParameters().normative);

        // Floor 4: 10 m below -> 2.0 m, the minimum 3.0 still binds
        SetbackOffsets f4 = engine.offsets(4, engine.heightBelow(4));
        CHECK(f4.back == doctest::Approx(3.0));
        CHECK_FALSE(f4.backEscalated);

        // Floor 6: 16 m below -> 3.2 m
        SetbackOffsets f6 = engine.offsets(6, engine.heightBelow(6));
        CHECK(f6.back == doctest::Approx(3.2));
        CHECK(f6.backEscalated);

        // Floor 14: 40 m below -> 8.0 m
        SetbackOffsets f14 = engine.offsets(14, engine.heightBelow(14));
        CHECK(f14.back == doctest::Approx(8.0));
    }

    TEST_CASE("back offset never decreases with the floor index") {
        SetbackEngine engine(testing::exampleParameters().normative);

        double previous = 0.0;
        for (int floor = 1; floor <= 40; ++floor) {
            double back = engine.offsets(floor, engine.heightBelow(floor)).back;
            CHECK(back >= previous);
            previous = back;
        }
    }

    TEST_CASE("height below a floor") {
        SetbackEngine engine(testing::exampleParameters().normative);

        CHECK(engine.heightBelow(1) == 0.0);
        CHECK(engine.heightBelow(2) == doctest::Approx(4.0));
        CHECK(engine.heightBelow(15) == doctest::Approx(43.0));
    }
}
