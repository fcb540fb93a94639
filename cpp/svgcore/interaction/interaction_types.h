#pragma once

#include <cstdint>

namespace svgcore {

enum class GestureState : std::uint8_t {
    Idle = 0,
    Armed = 1,
    Live = 2,
};

enum class GestureOutcome : std::uint8_t {
    None = 0,       // nothing was in progress
    Click = 1,      // released below the drag epsilon
    Committed = 2,
    Cancelled = 3,
    Failed = 4,     // the commit could not be applied; see the editor's last error
};

enum class DraftTool : std::uint8_t {
    Rect = 0,
    Circle = 1,
    Ellipse = 2,
    Line = 3,
    Path = 4,
    Text = 5,
    Group = 6,
};

} // namespace svgcore
