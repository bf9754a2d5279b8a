#include "AnimationManager.hpp"
#include "../../config/ConfigManager.hpp"
#include "../../config/ConfigValue.hpp"
#include "../../helpers/AnimatedVariable.hpp"
#include "../../macros.hpp"
#include "../../tabs/TabPage.hpp"
#include "../../tabs/TabBar.hpp"

#include <hyprutils/animation/AnimatedVariable.hpp>
#include <hyprutils/animation/AnimationManager.hpp>

CTabsAnimationManager::CTabsAnimationManager() {
    addBezierWithName("linear", Vector2D(0.0, 0.0), Vector2D(1.0, 1.0));
}

template <Animable VarType>
static void updateVariable(CAnimatedVariable<VarType>& av, const float POINTY, bool warp = false) {
    if (warp || av.value() == av.goal()) {
        av.warp(true, false);
        return;
    }

    const auto DELTA = av.goal() - av.begun();
    av.value()       = av.begun() + DELTA * POINTY;
}

template <Animable VarType>
static void handleUpdate(CAnimatedVariable<VarType>& av, bool warp) {
    const auto PPAGE = av.m_Context.pPage.lock();
    const auto PBAR  = av.m_Context.pBar.lock();

    const auto SPENT   = av.getPercent();
    const auto PBEZIER = g_pAnimationManager->getBezier(av.getBezierName());
    const auto POINTY  = PBEZIER->getYForPoint(SPENT);
    const bool WARP    = warp || SPENT >= 1.f;

    updateVariable<VarType>(av, POINTY, WARP);

    av.onUpdate();

    switch (av.m_Context.eDamagePolicy) {
        case AVARDAMAGE_ENTIRE: {
            if (PPAGE)
                PPAGE->damage();
            else if (PBAR)
                PBAR->damage();
            break;
        }
        default: {
            break;
        }
    }
}

void CTabsAnimationManager::tick() {
    static auto PANIMENABLED = CConfigValue<Hyprlang::INT>("animations:enabled");

    // end callbacks may start new animations, those get appended and picked up in this same pass
    for (size_t i = 0; i < m_vActiveAnimatedVariables.size(); i++) {
        const auto PAV = m_vActiveAnimatedVariables[i].lock();
        if (!PAV)
            continue;

        // for disabled anims just warp
        bool warp = !*PANIMENABLED || !PAV->enabled();

        switch (PAV->m_Type) {
            case AVARTYPE_FLOAT: {
                auto pTypedAV = dynamic_cast<CAnimatedVariable<float>*>(PAV.get());
                RASSERT(pTypedAV, "Failed to upcast animated float");
                handleUpdate(*pTypedAV, warp);
            } break;
            case AVARTYPE_VECTOR: {
                auto pTypedAV = dynamic_cast<CAnimatedVariable<Vector2D>*>(PAV.get());
                RASSERT(pTypedAV, "Failed to upcast animated Vector2D");
                handleUpdate(*pTypedAV, warp);
            } break;
            default: UNREACHABLE();
        }
    }

    tickDone();
}

void CTabsAnimationManager::frameTick() {
    onTicked();

    if (!shouldTickForNext())
        return;

    if (!m_lastTickValid || m_lastTickTimer.getMillis() >= 1.0f) {
        m_lastTickTimer.reset();
        m_lastTickValid = true;

        tick();
    }

    if (shouldTickForNext())
        scheduleTick();
}

void CTabsAnimationManager::scheduleTick() {
    if (m_tickScheduled)
        return;

    Log::logger->log(Log::TRACE, "CTabsAnimationManager: tick scheduled, {} active", m_vActiveAnimatedVariables.size());

    m_tickScheduled = true;
}

void CTabsAnimationManager::onTicked() {
    m_tickScheduled = false;
}

bool CTabsAnimationManager::tickScheduled() const {
    return m_tickScheduled;
}

std::string CTabsAnimationManager::styleValidInConfigVar(const std::string& config, const std::string& style) {
    if (config.starts_with("tabs")) {
        if (style == "sidebyside" || style == "overlap" || style == "push" || style == "fade")
            return "";

        return "unknown style";
    } else if (config == "tabBar") {
        if (style == "slide")
            return "";

        return "unknown style";
    }

    return "animation has no styles";
}
