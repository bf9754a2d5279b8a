#pragma once

#include <managers/animation/AnimationManager.hpp>
#include <tabs/TabPage.hpp>

#include <string>
#include <vector>

namespace Tests {
    // animations are disabled for the whole run, so every tick finishes what's running
    inline void settleAnimations() {
        for (int i = 0; i < 32 && g_pAnimationManager->shouldTickForNext(); ++i) {
            g_pAnimationManager->tick();
        }
    }

    inline std::vector<PHLPAGE> makePages(size_t count, const std::string& prefix = "page") {
        std::vector<PHLPAGE> pages;
        for (size_t i = 0; i < count; ++i) {
            pages.emplace_back(CTabPage::create(prefix + std::to_string(i)));
        }
        return pages;
    }

    inline constexpr double CONTAINER_W = 1000.0;
    inline constexpr double CONTAINER_H = 2000.0;
    inline constexpr double BAR_H       = 50.0;
};
