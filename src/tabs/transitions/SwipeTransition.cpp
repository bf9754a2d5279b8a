#include "SwipeTransition.hpp"
#include "../TabPage.hpp"
#include "../TransitionContext.hpp"
#include "../../config/ConfigManager.hpp"

std::optional<eSwipeAnimationType> swipeAnimationTypeFromString(const std::string& style) {
    if (style == "sidebyside")
        return SWIPE_ANIMATION_SIDE_BY_SIDE;
    if (style == "overlap")
        return SWIPE_ANIMATION_OVERLAP;
    if (style == "push")
        return SWIPE_ANIMATION_PUSH;
    if (style == "fade")
        return SWIPE_ANIMATION_FADE;
    return std::nullopt;
}

CSwipeTransition::CSwipeTransition(const std::string& animationNode, std::optional<eSwipeAnimationType> type) : ITabTransition(animationNode), m_type(type) {
    ;
}

void CSwipeTransition::setAnimationType(std::optional<eSwipeAnimationType> type) {
    m_type = type;
}

eSwipeAnimationType CSwipeTransition::animationType() const {
    if (m_type.has_value())
        return *m_type;

    const auto PCONFIG = g_pConfigManager->getAnimationPropertyConfig(m_animationNode);
    if (!PCONFIG)
        return SWIPE_ANIMATION_SIDE_BY_SIDE;

    const auto PVALUES = PCONFIG->pValues.lock();
    if (!PVALUES || PVALUES->internalStyle.empty())
        return SWIPE_ANIMATION_SIDE_BY_SIDE;

    return swipeAnimationTypeFromString(PVALUES->internalStyle).value_or(SWIPE_ANIMATION_SIDE_BY_SIDE);
}

void CSwipeTransition::prepare(SP<CTransitionContext> ctx) {
    m_runningType = animationType();

    ctx->m_from->setVisible(true);
    ctx->m_to->setVisible(true);

    step(ctx, 0.F);
}

void CSwipeTransition::step(SP<CTransitionContext> ctx, float progress) {
    const double W   = ctx->m_containerBox.w;
    // incoming page enters from the left when moving to a lower index
    const double DIR = m_fromLeft ? 1.0 : -1.0;

    const auto   INCOMING = Vector2D{-DIR * W * (1.0 - progress), 0.0};

    switch (m_runningType) {
        case SWIPE_ANIMATION_SIDE_BY_SIDE:
            ctx->m_to->m_renderOffset->setValueAndWarp(INCOMING);
            ctx->m_from->m_renderOffset->setValueAndWarp(Vector2D{DIR * W * progress, 0.0});
            break;
        case SWIPE_ANIMATION_OVERLAP:
            ctx->m_to->m_renderOffset->setValueAndWarp(INCOMING);
            ctx->m_from->m_renderOffset->setValueAndWarp(Vector2D{0.0, 0.0});
            break;
        case SWIPE_ANIMATION_PUSH:
            ctx->m_to->m_renderOffset->setValueAndWarp(INCOMING);
            ctx->m_from->m_renderOffset->setValueAndWarp(Vector2D{DIR * W / 3.0 * progress, 0.0});
            break;
        case SWIPE_ANIMATION_FADE:
            ctx->m_to->m_renderOffset->setValueAndWarp(Vector2D{0.0, 0.0});
            ctx->m_from->m_renderOffset->setValueAndWarp(Vector2D{0.0, 0.0});
            ctx->m_to->m_alpha->setValueAndWarp(progress);
            ctx->m_from->m_alpha->setValueAndWarp(1.F - progress);
            break;
    }
}

void CSwipeTransition::finalize(SP<CTransitionContext> ctx, bool cancelled) {
    ctx->m_from->resetPresentation();
    ctx->m_to->resetPresentation();

    ctx->m_from->setVisible(cancelled);
    ctx->m_to->setVisible(!cancelled);
}
