#pragma once

#include <cstdint>

#include "../../helpers/math/Math.hpp"

enum eSwipePhase : uint8_t {
    SWIPE_PHASE_BEGAN = 0,
    SWIPE_PHASE_CHANGED,
    SWIPE_PHASE_ENDED,
    SWIPE_PHASE_CANCELLED,
};

enum eScreenEdge : uint8_t {
    SCREEN_EDGE_LEFT = 0,
    SCREEN_EDGE_RIGHT,
};

// one classified pan update, in container coordinates
struct SSwipeSample {
    eSwipePhase phase = SWIPE_PHASE_BEGAN;
    Vector2D    translation;
    Vector2D    velocity; // px/s
};

struct STouchEvent {
    int32_t  touchID = 0;
    Vector2D pos;
    uint32_t timeMs = 0;
};
