#include "BarVisibilityController.hpp"
#include "TabBar.hpp"
#include "TabPage.hpp"
#include "TransitionContext.hpp"

using namespace Tabs;

CBarVisibilityController::CBarVisibilityController(WP<ITabContainer> container) : m_container(container) {
    ;
}

bool CBarVisibilityController::isHidden() const {
    const auto PCONTAINER = m_container.lock();
    if (!PCONTAINER)
        return false;

    const auto PBAR = PCONTAINER->tabBar();
    if (!PBAR)
        return true;

    return PBAR->m_frame.intersection(PCONTAINER->containerBox()).empty();
}

void CBarVisibilityController::setHidden(bool hidden, bool animated, SP<CTransitionContext> along) {
    const auto PCONTAINER = m_container.lock();
    if (!PCONTAINER)
        return;

    const auto PBAR = PCONTAINER->tabBar();
    if (!PBAR)
        return;

    if (isHidden() == hidden) {
        Log::logger->log(Log::TRACE, "CBarVisibilityController: bar already {}", hidden ? "hidden" : "shown");
        return;
    }

    const double OFFSETY    = hidden ? PBAR->height() : -PBAR->height();
    const CBox   STARTFRAME = PBAR->m_frame;
    const CBox   ENDFRAME   = STARTFRAME.copy().translate(Vector2D{0.0, OFFSETY});

    const auto   PPAGE = PCONTAINER->selectedPage();

    // the bar's share of the page insets: gone while hidden, back once a show has settled
    CContentInsets originalInsets, newInsets;
    if (PPAGE) {
        originalInsets = PPAGE->m_insets;
        newInsets      = PPAGE->m_insets;
        newInsets.setType(INSET_DYNAMIC_TYPE_TAB_BAR, {}, {0.0, hidden ? 0.0 : PBAR->height()});

        if (hidden)
            PPAGE->m_insets = newInsets;
    }

    Log::logger->log(Log::DEBUG, "CBarVisibilityController: {} bar, animated {}, paired {}", hidden ? "hiding" : "showing", animated, !!along);

    PBAR->m_frame = ENDFRAME;

    if (!animated) {
        PBAR->m_position->setValueAndWarp(ENDFRAME.pos());
        if (!hidden && PPAGE)
            PPAGE->m_insets = newInsets;
        return;
    }

    PHLBARREF  barRef  = PBAR;
    PHLPAGEREF pageRef = PPAGE;

    if (along) {
        const auto STARTPOS = PBAR->m_position->value();
        const auto ENDPOS   = ENDFRAME.pos();

        const bool PAIRED = along->animateAlongside(
            [barRef, STARTPOS, ENDPOS](float progress) {
                const auto BAR = barRef.lock();
                if (!BAR)
                    return;

                BAR->m_position->setValueAndWarp(STARTPOS + (ENDPOS - STARTPOS) * progress);
            },
            [barRef, pageRef, hidden, STARTFRAME, originalInsets, newInsets](bool cancelled) {
                const auto BAR = barRef.lock();
                if (!BAR)
                    return;

                if (cancelled) {
                    BAR->m_frame = STARTFRAME;
                    BAR->m_position->setValueAndWarp(STARTFRAME.pos());
                }

                const auto PAGE = pageRef.lock();
                if (!PAGE)
                    return;

                if (cancelled)
                    PAGE->m_insets = originalInsets;
                else if (!hidden)
                    PAGE->m_insets = newInsets;
            });

        if (PAIRED)
            return;

        Log::logger->log(Log::DEBUG, "CBarVisibilityController: transition already over, animating on its own");
    }

    // assigning the current goal wouldn't start anything, so there'd be no end to wait for
    if (PBAR->m_position->goal() == ENDFRAME.pos() && !PBAR->m_position->isBeingAnimated()) {
        if (!hidden && PPAGE)
            PPAGE->m_insets = newInsets;
        return;
    }

    PBAR->m_position->setCallbackOnEnd([barRef, pageRef, hidden, newInsets](auto) {
        const auto BAR = barRef.lock();
        if (!BAR || hidden)
            return;

        if (const auto PAGE = pageRef.lock())
            PAGE->m_insets = newInsets;
    });

    *PBAR->m_position = ENDFRAME.pos();
}

void CBarVisibilityController::onTransitionStart(bool touchesFirstPage) {
    if (!m_choreographyEnabled || !touchesFirstPage)
        return;

    setHidden(true);
}

void CBarVisibilityController::onTransitionFinish() {
    if (isHidden())
        setHidden(false);
}

void CBarVisibilityController::setChoreographyEnabled(bool enabled) {
    m_choreographyEnabled = enabled;
}

bool CBarVisibilityController::choreographyEnabled() const {
    return m_choreographyEnabled;
}
