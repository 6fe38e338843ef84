#pragma once

#include "massing/lot/LotGeometry.h"
#include "massing/params/ParameterSet.h"

namespace massing {
namespace building {

// Inward offset distance per face role for one floor (metres)
struct SetbackOffsets {
    double front = 0.0;
    double back = 0.0;
    double side = 0.0;

    // True when the percentage rule raised the back offset above its minimum
    bool backEscalated = false;

    double forRole(lot::FaceRole role) const {
        switch (role) {
            case lot::FaceRole::Front: return front;
            case lot::FaceRole::Back: return back;
            case lot::FaceRole::Side: return side;
        }
        return side;
    }

    bool operator==(const SetbackOffsets& other) const {
        return front == other.front && back == other.back && side == other.side &&
               backEscalated == other.backEscalated;
    }
};

/**
 * SetbackEngine - per-floor setback rules.
 *
 * Front and side offsets are the fixed minimums on every floor. From
 * min_setback_start_floor upwards the back offset is
 *   max(min_back_setback, back_setback_percent * height below the floor),
 * below it the back offset is the fixed minimum.
 */
class SetbackEngine {
public:
    explicit SetbackEngine(const params::NormativeParameters& normative);

    // floorIndex is 1-based; heightBelow is the summed height of floors 1..floorIndex-1
    SetbackOffsets offsets(int floorIndex, double heightBelow) const;

    // Height of floors 1..floorIndex-1 with the ground/upper floor heights
    double heightBelow(int floorIndex) const;

private:
    params::NormativeParameters normative_;
};

} // namespace building
} // namespace massing
