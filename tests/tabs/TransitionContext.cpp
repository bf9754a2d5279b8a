#include <tabs/TransitionContext.hpp>
#include <tabs/PercentDrivenTransition.hpp>
#include <tabs/transitions/SwipeTransition.hpp>

#include "../shared/TestEnvironment.hpp"

#include <gtest/gtest.h>

using namespace Tests;

static SP<CTransitionContext> makeContext(const std::vector<PHLPAGE>& pages, bool interactive) {
    return CTransitionContext::create(pages[0], pages[1], 0, 1, CBox{0, 0, CONTAINER_W, CONTAINER_H}, interactive);
}

TEST(TransitionContext, runsOnItsOwn) {
    const auto PAGES = makePages(2);
    const auto CTX   = makeContext(PAGES, false);
    const auto STYLE = makeShared<CSwipeTransition>("tabsTap");

    int        starts = 0, finishes = 0;
    STYLE->m_start  = [&starts] { starts++; };
    STYLE->m_finish = [&finishes] { finishes++; };

    std::optional<bool> cancelled;
    CTX->m_events.completed.listenStatic([&cancelled](bool c) { cancelled = c; });

    STYLE->animateTransition(CTX);

    EXPECT_EQ(starts, 1);
    EXPECT_EQ(finishes, 0);
    EXPECT_FALSE(CTX->isCompleted());
    EXPECT_TRUE(CTX->isSettling());

    settleAnimations();

    EXPECT_EQ(starts, 1);
    EXPECT_EQ(finishes, 1);
    EXPECT_TRUE(CTX->isCompleted());
    ASSERT_TRUE(cancelled.has_value());
    EXPECT_FALSE(*cancelled);
    EXPECT_FLOAT_EQ(CTX->progress(), 1.F);

    EXPECT_FALSE(PAGES[0]->m_visible);
    EXPECT_TRUE(PAGES[1]->m_visible);
}

TEST(TransitionContext, alongsideFollowsProgress) {
    const auto PAGES = makePages(2);
    const auto CTX   = makeContext(PAGES, true);
    const auto STYLE = makeShared<CSwipeTransition>("tabsSwipe");

    STYLE->animateTransition(CTX);

    float               lastStep = -1.F;
    std::optional<bool> alongCancelled;

    EXPECT_TRUE(CTX->animateAlongside([&lastStep](float p) { lastStep = p; }, [&alongCancelled](bool c) { alongCancelled = c; }));

    // stepped right away with the current progress
    EXPECT_FLOAT_EQ(lastStep, 0.F);

    CTX->updateInteractiveTransition(0.25F);
    EXPECT_FLOAT_EQ(lastStep, 0.25F);

    CTX->updateInteractiveTransition(1.5F);
    EXPECT_FLOAT_EQ(lastStep, 1.F);
    EXPECT_FLOAT_EQ(CTX->progress(), 1.F);

    CTX->updateInteractiveTransition(0.4F);
    CTX->cancelInteractiveTransition();
    settleAnimations();

    EXPECT_FLOAT_EQ(lastStep, 0.F);
    ASSERT_TRUE(alongCancelled.has_value());
    EXPECT_TRUE(*alongCancelled);
    EXPECT_TRUE(CTX->transitionWasCancelled());

    EXPECT_FALSE(CTX->animateAlongside([](float) {}, [](bool) {}));
}

TEST(TransitionContext, completesOnce) {
    const auto PAGES = makePages(2);
    const auto CTX   = makeContext(PAGES, true);

    int        completions = 0;
    CTX->m_events.completed.listenStatic([&completions](bool) { completions++; });

    CTX->completeTransition(true);
    CTX->completeTransition(false);

    EXPECT_EQ(completions, 1);
    EXPECT_FALSE(CTX->transitionWasCancelled());
}

TEST(TransitionContext, percentDriverRecordsBeforeAttach) {
    CPercentDrivenTransition driver;

    driver.update(0.3F);

    EXPECT_FLOAT_EQ(driver.percentComplete(), 0.3F);
    EXPECT_FALSE(driver.isDriving());

    // nothing attached, nothing to do
    driver.finish();
    driver.cancel();

    const auto PAGES = makePages(2);
    const auto CTX   = makeContext(PAGES, true);
    const auto STYLE = makeShared<CSwipeTransition>("tabsSwipe");

    driver.startInteractiveTransition(CTX, STYLE);

    EXPECT_TRUE(driver.isDriving());
    EXPECT_FLOAT_EQ(driver.percentComplete(), 0.F);

    driver.update(0.6F);
    EXPECT_FLOAT_EQ(CTX->progress(), 0.6F);

    driver.finish();
    EXPECT_FALSE(driver.isDriving());

    settleAnimations();

    EXPECT_TRUE(CTX->isCompleted());
    EXPECT_FALSE(CTX->transitionWasCancelled());
}
