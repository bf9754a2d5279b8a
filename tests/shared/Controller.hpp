#pragma once

#include <tabs/SwipeableTabController.hpp>

#include "TestEnvironment.hpp"

namespace Tests {
    inline UP<CSwipeableTabController> makeController(size_t pages, size_t selected = 0) {
        auto controller = makeUnique<CSwipeableTabController>(CBox{0, 0, CONTAINER_W, CONTAINER_H}, BAR_H);
        if (pages > 0)
            (void)controller->setPages(makePages(pages), selected);
        return controller;
    }

    inline SSwipeSample pan(eSwipePhase phase, const Vector2D& translation, const Vector2D& velocity) {
        return SSwipeSample{.phase = phase, .translation = translation, .velocity = velocity};
    }
};
