#include <tabs/TransitionContext.hpp>
#include <tabs/transitions/SwipeTransition.hpp>
#include <config/ConfigManager.hpp>

#include "../shared/TestEnvironment.hpp"

#include <gtest/gtest.h>

using namespace Tests;

struct SStyleRun {
    std::vector<PHLPAGE>   pages;
    SP<CTransitionContext> ctx;
    SP<CSwipeTransition>   style;
};

static SStyleRun startRun(eSwipeAnimationType type, bool fromLeft) {
    SStyleRun run;
    run.pages            = makePages(2);
    run.ctx              = CTransitionContext::create(run.pages[0], run.pages[1], 0, 1, CBox{0, 0, CONTAINER_W, CONTAINER_H}, true);
    run.style            = makeShared<CSwipeTransition>("tabsSwipe", type);
    run.style->m_fromLeft = fromLeft;
    run.style->animateTransition(run.ctx);
    return run;
}

TEST(SwipeTransition, styleFromString) {
    EXPECT_EQ(swipeAnimationTypeFromString("sidebyside"), SWIPE_ANIMATION_SIDE_BY_SIDE);
    EXPECT_EQ(swipeAnimationTypeFromString("overlap"), SWIPE_ANIMATION_OVERLAP);
    EXPECT_EQ(swipeAnimationTypeFromString("push"), SWIPE_ANIMATION_PUSH);
    EXPECT_EQ(swipeAnimationTypeFromString("fade"), SWIPE_ANIMATION_FADE);
    EXPECT_FALSE(swipeAnimationTypeFromString("slide").has_value());
}

TEST(SwipeTransition, sideBySide) {
    auto run = startRun(SWIPE_ANIMATION_SIDE_BY_SIDE, false);

    // nothing moved yet, the incoming page waits off the right edge
    EXPECT_EQ(run.pages[1]->m_renderOffset->value(), Vector2D(CONTAINER_W, 0));
    EXPECT_EQ(run.pages[0]->m_renderOffset->value(), Vector2D(0, 0));
    EXPECT_TRUE(run.pages[0]->m_visible);
    EXPECT_TRUE(run.pages[1]->m_visible);

    run.ctx->updateInteractiveTransition(0.5F);

    EXPECT_EQ(run.pages[1]->m_renderOffset->value(), Vector2D(CONTAINER_W / 2.0, 0));
    EXPECT_EQ(run.pages[0]->m_renderOffset->value(), Vector2D(-CONTAINER_W / 2.0, 0));

    run.ctx->finishInteractiveTransition();
    settleAnimations();

    EXPECT_TRUE(run.ctx->isCompleted());
    EXPECT_FALSE(run.pages[0]->m_visible);
    EXPECT_TRUE(run.pages[1]->m_visible);
    EXPECT_EQ(run.pages[0]->m_renderOffset->value(), Vector2D(0, 0));
    EXPECT_EQ(run.pages[1]->m_renderOffset->value(), Vector2D(0, 0));
}

TEST(SwipeTransition, fromLeftMirrors) {
    auto run = startRun(SWIPE_ANIMATION_SIDE_BY_SIDE, true);

    run.ctx->updateInteractiveTransition(0.25F);

    EXPECT_EQ(run.pages[1]->m_renderOffset->value(), Vector2D(-CONTAINER_W * 0.75, 0));
    EXPECT_EQ(run.pages[0]->m_renderOffset->value(), Vector2D(CONTAINER_W * 0.25, 0));

    run.ctx->cancelInteractiveTransition();
    settleAnimations();

    EXPECT_TRUE(run.ctx->transitionWasCancelled());
    EXPECT_TRUE(run.pages[0]->m_visible);
    EXPECT_FALSE(run.pages[1]->m_visible);
}

TEST(SwipeTransition, overlapAndPush) {
    auto overlap = startRun(SWIPE_ANIMATION_OVERLAP, false);
    overlap.ctx->updateInteractiveTransition(0.5F);

    EXPECT_EQ(overlap.pages[1]->m_renderOffset->value(), Vector2D(CONTAINER_W / 2.0, 0));
    EXPECT_EQ(overlap.pages[0]->m_renderOffset->value(), Vector2D(0, 0));

    auto push = startRun(SWIPE_ANIMATION_PUSH, false);
    push.ctx->updateInteractiveTransition(0.5F);

    EXPECT_EQ(push.pages[1]->m_renderOffset->value(), Vector2D(CONTAINER_W / 2.0, 0));
    EXPECT_NEAR(push.pages[0]->m_renderOffset->value().x, -CONTAINER_W / 6.0, 0.001);

    overlap.ctx->cancelInteractiveTransition();
    push.ctx->cancelInteractiveTransition();
    settleAnimations();
}

TEST(SwipeTransition, fade) {
    auto run = startRun(SWIPE_ANIMATION_FADE, false);

    run.ctx->updateInteractiveTransition(0.25F);

    EXPECT_EQ(run.pages[1]->m_renderOffset->value(), Vector2D(0, 0));
    EXPECT_FLOAT_EQ(run.pages[1]->m_alpha->value(), 0.25F);
    EXPECT_FLOAT_EQ(run.pages[0]->m_alpha->value(), 0.75F);

    run.ctx->finishInteractiveTransition();
    settleAnimations();

    EXPECT_FLOAT_EQ(run.pages[0]->m_alpha->value(), 1.F);
    EXPECT_FLOAT_EQ(run.pages[1]->m_alpha->value(), 1.F);
}

TEST(SwipeTransition, typeFromAnimationNode) {
    CSwipeTransition style("tabsSwipe");
    EXPECT_EQ(style.animationType(), SWIPE_ANIMATION_SIDE_BY_SIDE);

    EXPECT_EQ(g_pConfigManager->parseKeyword("animation", "tabsSwipe, 1, 4, linear, push"), "");
    EXPECT_EQ(style.animationType(), SWIPE_ANIMATION_PUSH);

    // explicit type wins
    style.setAnimationType(SWIPE_ANIMATION_FADE);
    EXPECT_EQ(style.animationType(), SWIPE_ANIMATION_FADE);
    style.setAnimationType(std::nullopt);

    // the tap node isn't a child of the swipe node
    EXPECT_EQ(CSwipeTransition("tabsTap").animationType(), SWIPE_ANIMATION_SIDE_BY_SIDE);

    g_pConfigManager->reload();
    EXPECT_EQ(style.animationType(), SWIPE_ANIMATION_SIDE_BY_SIDE);
}
