#include <managers/input/SwipeInteractor.hpp>
#include <tabs/PercentDrivenTransition.hpp>
#include <tabs/TransitionContext.hpp>

#include "../shared/Controller.hpp"

#include <gtest/gtest.h>

using namespace Tests;

static void beginDrag(CSwipeableTabController& c, bool rightToLeft, const Vector2D& translation = {}) {
    const auto T = translation == Vector2D{} ? Vector2D{rightToLeft ? -10.0 : 10.0, 0.0} : translation;
    c.interactor()->handlePan(pan(SWIPE_PHASE_BEGAN, T, {rightToLeft ? -300.0 : 300.0, 0.0}));
}

TEST(SwipeInteractor, directionEligibility) {
    for (size_t idx = 0; idx < 3; ++idx) {
        for (bool rtl : {true, false}) {
            auto       c        = makeController(3, idx);
            const bool ELIGIBLE = (rtl && idx == 0) || (!rtl && idx == 1);

            beginDrag(*c, rtl);

            EXPECT_EQ(c->interactor()->interactionInProgress(), ELIGIBLE) << "index " << idx << " rtl " << rtl;
            EXPECT_EQ(c->interactor()->isRightToLeft(), rtl);

            if (!ELIGIBLE) {
                EXPECT_EQ(c->container()->selectedIndex(), idx);
                EXPECT_FALSE(c->container()->activeTransition());
                continue;
            }

            EXPECT_EQ(c->container()->selectedIndex(), rtl ? idx + 1 : idx - 1);
            ASSERT_TRUE(c->container()->activeTransition());
            EXPECT_TRUE(c->container()->activeTransition()->isInteractive());

            c->interactor()->handlePan(pan(SWIPE_PHASE_CANCELLED, {}, {}));
            settleAnimations();

            EXPECT_EQ(c->container()->selectedIndex(), idx);
        }
    }
}

TEST(SwipeInteractor, boundaryClamp) {
    // the only page is also the last one
    auto single = makeController(1);
    beginDrag(*single, true);

    EXPECT_FALSE(single->interactor()->interactionInProgress());
    EXPECT_EQ(single->container()->selectedIndex(), 0);

    auto two = makeController(2);
    beginDrag(*two, false);

    EXPECT_FALSE(two->interactor()->interactionInProgress());
    EXPECT_EQ(two->container()->selectedIndex(), 0);

    auto last = makeController(2, 1);
    beginDrag(*last, true);

    EXPECT_FALSE(last->interactor()->interactionInProgress());
    EXPECT_EQ(last->container()->selectedIndex(), 1);
}

TEST(SwipeInteractor, progressClamp) {
    auto c = makeController(3);
    beginDrag(*c, true);
    ASSERT_TRUE(c->interactor()->interactionInProgress());

    const auto DRIVER = c->interactor()->progressDriver();

    for (int i = 0; i <= 80; ++i) {
        const double TV = -2.0 + i * 0.05;

        c->interactor()->handlePan(pan(SWIPE_PHASE_CHANGED, {TV * CONTAINER_W, 0.0}, {-300.0, 0.0}));

        const float FRACTION = DRIVER->percentComplete();

        EXPECT_GE(FRACTION, 0.F) << "at " << TV;
        EXPECT_LE(FRACTION, 0.99F) << "at " << TV;

        if (TV > 0.001)
            EXPECT_EQ(FRACTION, 0.F) << "at " << TV;

        if (TV < -0.51) {
            EXPECT_GT(FRACTION, 0.5F) << "at " << TV;
            EXPECT_TRUE(c->interactor()->shouldComplete()) << "at " << TV;
        } else if (TV > -0.49 && TV < 0.0)
            EXPECT_FALSE(c->interactor()->shouldComplete()) << "at " << TV;
    }

    c->interactor()->handlePan(pan(SWIPE_PHASE_CANCELLED, {}, {}));
    settleAnimations();
}

TEST(SwipeInteractor, velocityOverridesOnRelease) {
    for (double velocity : {-250.0, -150.0}) {
        auto       c         = makeController(3);
        const bool COMMITS   = velocity < -200.0;
        int        committed = 0;
        auto       listener  = c->interactor()->m_events.transitionFinished.listen([&committed] { committed++; });

        std::vector<bool> ended;
        auto              endListener = c->container()->m_events.transitionEnded.listen([&ended](bool cancelled) { ended.emplace_back(cancelled); });

        beginDrag(*c, true);
        c->interactor()->handlePan(pan(SWIPE_PHASE_CHANGED, {-0.3 * CONTAINER_W, 0.0}, {-100.0, 0.0}));

        EXPECT_FLOAT_EQ(c->interactor()->progressDriver()->percentComplete(), 0.3F);
        EXPECT_FALSE(c->interactor()->shouldComplete());

        c->interactor()->handlePan(pan(SWIPE_PHASE_ENDED, {-0.3 * CONTAINER_W, 0.0}, {velocity, 0.0}));

        EXPECT_FALSE(c->interactor()->interactionInProgress());
        EXPECT_EQ(committed, COMMITS ? 1 : 0);

        settleAnimations();

        EXPECT_EQ(c->container()->selectedIndex(), COMMITS ? 1 : 0) << "velocity " << velocity;
        EXPECT_EQ(ended, (std::vector<bool>{!COMMITS}));
    }
}

TEST(SwipeInteractor, cancelledAlwaysRollsBack) {
    auto c         = makeController(3);
    int  committed = 0, selected = 0, finished = 0;

    auto l1 = c->interactor()->m_events.transitionFinished.listen([&committed] { committed++; });
    auto l2 = c->container()->m_events.selected.listen([&selected](PHLPAGE) { selected++; });
    auto l3 = c->interactor()->m_events.gestureFinished.listen([&finished] { finished++; });

    beginDrag(*c, true);
    c->interactor()->handlePan(pan(SWIPE_PHASE_CHANGED, {-0.9 * CONTAINER_W, 0.0}, {-1000.0, 0.0}));
    EXPECT_TRUE(c->interactor()->shouldComplete());

    c->interactor()->handlePan(pan(SWIPE_PHASE_CANCELLED, {-0.9 * CONTAINER_W, 0.0}, {-1000.0, 0.0}));

    EXPECT_EQ(finished, 1);
    EXPECT_EQ(committed, 0);

    settleAnimations();

    EXPECT_EQ(c->container()->selectedIndex(), 0);
    EXPECT_EQ(selected, 0);
    EXPECT_FALSE(c->container()->activeTransition());
}

TEST(SwipeInteractor, diagonalSuspend) {
    auto c       = makeController(3);
    int  started = 0;
    auto l       = c->interactor()->m_events.gestureStarted.listen([&started] { started++; });

    c->interactor()->handlePan(pan(SWIPE_PHASE_BEGAN, {-20.0, 10.0}, {-500.0, 0.0}));

    EXPECT_EQ(started, 1);
    EXPECT_TRUE(c->interactor()->isSuspended());
    EXPECT_FALSE(c->interactor()->interactionInProgress());
    EXPECT_EQ(c->container()->selectedIndex(), 0);

    // vertical velocity alone is enough
    c->interactor()->handlePan(pan(SWIPE_PHASE_BEGAN, {-20.0, 0.0}, {-500.0, 150.0}));
    EXPECT_TRUE(c->interactor()->isSuspended());
    EXPECT_FALSE(c->interactor()->interactionInProgress());

    // suspended gestures ignore the rest of the stream
    int  finished = 0;
    auto l2       = c->interactor()->m_events.gestureFinished.listen([&finished] { finished++; });
    c->interactor()->handlePan(pan(SWIPE_PHASE_CHANGED, {-600.0, 10.0}, {-500.0, 0.0}));
    c->interactor()->handlePan(pan(SWIPE_PHASE_ENDED, {-600.0, 10.0}, {-500.0, 0.0}));
    EXPECT_EQ(finished, 0);
    EXPECT_EQ(c->container()->selectedIndex(), 0);

    c->setDiagonalSwipe(true);
    c->interactor()->handlePan(pan(SWIPE_PHASE_BEGAN, {-20.0, 10.0}, {-500.0, 0.0}));

    EXPECT_FALSE(c->interactor()->isSuspended());
    EXPECT_TRUE(c->interactor()->interactionInProgress());
    EXPECT_EQ(c->container()->selectedIndex(), 1);

    c->interactor()->handlePan(pan(SWIPE_PHASE_CANCELLED, {}, {}));
    settleAnimations();
}

TEST(SwipeInteractor, refusedSelectionIsNotInProgress) {
    auto c = makeController(3);

    // a tap switch is still settling
    ASSERT_TRUE(c->container()->userSelect(2));
    ASSERT_TRUE(c->container()->activeTransition());
    EXPECT_FALSE(c->container()->setSelectedIndex(0));

    settleAnimations();
    ASSERT_TRUE(c->container()->userSelect(0));

    beginDrag(*c, true);

    EXPECT_FALSE(c->interactor()->interactionInProgress());
    EXPECT_EQ(c->container()->selectedIndex(), 0);

    settleAnimations();
}

TEST(SwipeInteractor, wiresToContent) {
    auto       c       = makeController(0);
    const auto INNER   = CTabPage::create("inner");
    const auto WRAPPER = CTabPage::createWrapper("nav", {INNER, CTabPage::create("pushed")});
    const auto OTHER   = CTabPage::create("other");

    ASSERT_TRUE(c->setPages({WRAPPER, OTHER}));

    EXPECT_EQ(c->interactor()->boundPage(), INNER);
    EXPECT_TRUE(c->interactor()->hasRecognizersFor(WRAPPER));
    EXPECT_EQ(c->interactor()->registeredPairs(), 1);

    const auto OLDLEFT = c->interactor()->recognizerFor(INNER, SCREEN_EDGE_LEFT);

    c->interactor()->wireTo(WRAPPER);

    EXPECT_EQ(c->interactor()->registeredPairs(), 1);
    EXPECT_NE(c->interactor()->recognizerFor(INNER, SCREEN_EDGE_LEFT), OLDLEFT);

    c->interactor()->wireTo(OTHER);

    EXPECT_EQ(c->interactor()->registeredPairs(), 2);
    EXPECT_EQ(c->interactor()->boundPage(), OTHER);
}

static STouchEvent touch(int32_t id, double x, uint32_t t) {
    return STouchEvent{.touchID = id, .pos = {x, 1000}, .timeMs = t};
}

TEST(SwipeInteractor, disablingMidDragRollsBack) {
    auto c         = makeController(3);
    int  finished  = 0;
    auto l         = c->interactor()->m_events.gestureFinished.listen([&finished] { finished++; });
    int  committed = 0;
    auto l2        = c->interactor()->m_events.transitionFinished.listen([&committed] { committed++; });

    c->onTouchDown(touch(0, CONTAINER_W - 5, 0));
    c->onTouchMotion(touch(0, CONTAINER_W - 15, 16));

    ASSERT_TRUE(c->interactor()->interactionInProgress());
    ASSERT_TRUE(c->container()->activeTransition());
    EXPECT_EQ(c->container()->selectedIndex(), 1);
    EXPECT_TRUE(c->isTabBarHidden());

    c->setSwipeEnabled(false);

    EXPECT_FALSE(c->isSwipeEnabled());
    EXPECT_FALSE(c->interactor()->interactionInProgress());
    EXPECT_EQ(finished, 1);
    EXPECT_EQ(committed, 0);
    EXPECT_FALSE(c->interactor()->recognizerFor(c->interactor()->boundPage(), SCREEN_EDGE_LEFT)->isEnabled());

    settleAnimations();

    EXPECT_FALSE(c->container()->activeTransition());
    EXPECT_EQ(c->container()->selectedIndex(), 0);
    EXPECT_FALSE(c->isTabBarHidden());

    // the lifted finger has nothing left to report
    c->onTouchUp(touch(0, CONTAINER_W - 15, 32));
    EXPECT_EQ(finished, 1);

    // and the container takes selections again
    EXPECT_TRUE(c->container()->userSelect(2));
    settleAnimations();
    EXPECT_EQ(c->container()->selectedIndex(), 2);

    c->setSwipeEnabled(true);
    EXPECT_TRUE(c->interactor()->recognizerFor(c->interactor()->boundPage(), SCREEN_EDGE_RIGHT)->isEnabled());
}

TEST(SwipeInteractor, secondTouchCannotTakeOver) {
    auto       c     = makeController(3);
    const auto PAGES = c->container()->pages();

    c->onTouchDown(touch(0, CONTAINER_W - 5, 0));
    c->onTouchMotion(touch(0, CONTAINER_W - 15, 16));

    ASSERT_TRUE(c->interactor()->interactionInProgress());
    ASSERT_EQ(c->container()->selectedIndex(), 1);
    ASSERT_EQ(c->interactor()->boundPage(), PAGES[1]);

    // lands on the freshly bound pair and heads the other way
    c->onTouchDown(touch(1, 5, 20));
    c->onTouchMotion(touch(1, 40, 36));

    const auto LEFT = c->interactor()->recognizerFor(PAGES[1], SCREEN_EDGE_LEFT);
    EXPECT_FALSE(LEFT->hasBegun());
    EXPECT_FALSE(LEFT->isTracking());
    EXPECT_TRUE(c->interactor()->interactionInProgress());
    EXPECT_EQ(c->container()->selectedIndex(), 1);

    // the first touch still owns the switch
    c->onTouchMotion(touch(0, 300, 48));
    EXPECT_TRUE(c->interactor()->shouldComplete());

    c->onTouchMotion(touch(1, 80, 50));
    c->onTouchUp(touch(1, 80, 52));
    EXPECT_TRUE(c->interactor()->interactionInProgress());

    c->onTouchUp(touch(0, 300, 64));
    EXPECT_FALSE(c->interactor()->interactionInProgress());

    settleAnimations();

    EXPECT_FALSE(c->container()->activeTransition());
    EXPECT_FALSE(c->interactor()->interactionActive());
    EXPECT_EQ(c->container()->selectedIndex(), 1);
}

TEST(SwipeInteractor, beganDuringInteractionIsIgnored) {
    auto c       = makeController(3);
    int  started = 0;
    auto l       = c->interactor()->m_events.gestureStarted.listen([&started] { started++; });

    beginDrag(*c, true);
    c->interactor()->handlePan(pan(SWIPE_PHASE_CHANGED, {-0.7 * CONTAINER_W, 0.0}, {-300.0, 0.0}));
    ASSERT_TRUE(c->interactor()->shouldComplete());

    // eligible on its own, index 1 going left-to-right
    beginDrag(*c, false);

    EXPECT_EQ(started, 1);
    EXPECT_TRUE(c->interactor()->interactionInProgress());
    EXPECT_TRUE(c->interactor()->isRightToLeft());
    EXPECT_TRUE(c->interactor()->shouldComplete());

    c->interactor()->handlePan(pan(SWIPE_PHASE_ENDED, {-0.7 * CONTAINER_W, 0.0}, {-300.0, 0.0}));
    settleAnimations();

    EXPECT_FALSE(c->container()->activeTransition());
    EXPECT_EQ(c->container()->selectedIndex(), 1);
}
