#pragma once

#include "massing/building/FloorRecord.h"
#include "massing/building/FootprintGenerator.h"
#include "massing/building/SetbackEngine.h"
#include "massing/lot/LotGeometry.h"
#include "massing/params/ParameterSet.h"
#include <functional>
#include <string>

namespace massing {
namespace building {

/**
 * FloorStackBuilder - grows a massing floor by floor.
 *
 * Starting at floor 1 on elevation 0 it asks the SetbackEngine for the
 * floor's offsets and the FootprintGenerator for its footprint, then moves
 * up by the ground or upper floor height. Growth stops when the next floor
 * would top out above max_height, when a footprint is rejected, or when
 * max_floor_count floors have been built.
 */
class FloorStackBuilder {
public:
    // Shape to use for a given 1-based floor index
    using ShapeProvider = std::function<ShapeVariant(int floorIndex)>;

    FloorStackBuilder(const lot::LotGeometry& lot, const params::ParameterSet& params);

    // Lot id quoted in log messages
    void setLotId(std::string lotId) { lotId_ = std::move(lotId); }

    // Same shape on every floor (the baseline uses the orthogonal shape)
    FloorStack build(const ShapeVariant& shape = ShapeVariant::orthogonal()) const;

    FloorStack build(const ShapeProvider& provider) const;

    // "Ground" for floor 1, "Level N" for floor N + 1
    static std::string floorLabel(int floorIndex);

private:
    const lot::LotGeometry& lot_;
    const params::ParameterSet& params_;
    SetbackEngine setbacks_;
    FootprintGenerator generator_;
    std::string lotId_ = "-";
};

} // namespace building
} // namespace massing
