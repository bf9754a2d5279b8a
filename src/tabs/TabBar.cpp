#include "TabBar.hpp"
#include "../config/ConfigManager.hpp"
#include "../managers/animation/AnimationManager.hpp"

PHLBAR CTabBar::create(const CBox& frame) {
    PHLBAR bar = makeShared<CTabBar>(frame);
    bar->m_self = bar;
    g_pAnimationManager->createAnimation(frame.pos(), bar->m_position, g_pConfigManager->getAnimationPropertyConfig("tabBar"), bar, AVARDAMAGE_ENTIRE);
    return bar;
}

CTabBar::CTabBar(const CBox& frame) : m_frame(frame) {
    ;
}

double CTabBar::height() const {
    return m_frame.h;
}

void CTabBar::damage() {
    m_events.damaged.emit();
}
