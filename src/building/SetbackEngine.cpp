#include "massing/building/SetbackEngine.h"

namespace massing {
namespace building {

SetbackEngine::SetbackEngine(const params::NormativeParameters& normative)
    : normative_(normative) {}

SetbackOffsets SetbackEngine::offsets(int floorIndex, double heightBelow) const {
    SetbackOffsets o;
    o.front = normative_.minFrontSetback;
    o.side = normative_.minSideSetback;
    o.back = normative_.minBackSetback;

    if (floorIndex >= normative_.minSetbackStartFloor) {
        double escalated = normative_.backSetbackPercent * heightBelow;
        if (escalated > normative_.minBackSetback) {
            o.back = escalated;
            o.backEscalated = true;
        }
    }
    return o;
}

double SetbackEngine::heightBelow(int floorIndex) const {
    if (floorIndex <= 1) return 0.0;
    return normative_.gfFloorHeight + (floorIndex - 2) * normative_.ufFloorHeight;
}

} // namespace building
} // namespace massing
