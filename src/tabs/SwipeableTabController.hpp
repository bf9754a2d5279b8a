#pragma once

#include <optional>

#include "TabTypes.hpp"
#include "TabContainer.hpp"
#include "TransitionCoordinator.hpp"
#include "BarVisibilityController.hpp"
#include "transitions/SwipeTransition.hpp"
#include "../managers/input/SwipeInteractor.hpp"
#include "../defines.hpp"

// A tab container whose pages can be switched by dragging from the screen edges.
// Owns the container and everything that drives it, and keeps them wired together.
class CSwipeableTabController {
  public:
    CSwipeableTabController(const CBox& box, double barHeight);
    ~CSwipeableTabController();

    std::expected<void, std::string> setPages(const std::vector<PHLPAGE>& pages, size_t selected = 0);

    void                             setSwipeAnimation(std::optional<eSwipeAnimationType> type);
    void                             setTapAnimation(std::optional<eSwipeAnimationType> type);
    // replaces the style used for drags, and for taps too when tap is set
    void                             setAnimationTransitioning(SP<ITabTransition> swipe, SP<ITabTransition> tap = nullptr);

    void                             setDiagonalSwipe(bool enabled);
    bool                             isDiagonalSwipeEnabled() const;
    void                             setSwipeEnabled(bool enabled);
    bool                             isSwipeEnabled() const;

    void                             setTabBarHidden(bool hidden, bool animated = true, SP<CTransitionContext> along = nullptr);
    bool                             isTabBarHidden() const;

    void                             onTouchDown(const STouchEvent& e);
    void                             onTouchMotion(const STouchEvent& e);
    void                             onTouchUp(const STouchEvent& e);
    void                             onTouchCancel(const STouchEvent& e);

    // re-reads the tabs:* options, also runs on every config reload
    void                             applyConfig();

    SP<CTabContainer>                container() const;
    SP<CTransitionCoordinator>       coordinator() const;
    SP<CSwipeInteractor>             interactor() const;
    CBarVisibilityController&        barController() const;
    SP<CSwipeTransition>             defaultSwipeTransition() const;
    SP<CSwipeTransition>             defaultTapTransition() const;

  private:
    SP<CTabContainer>            m_container;
    SP<CTransitionCoordinator>   m_coordinator;
    SP<CSwipeInteractor>         m_interactor;
    UP<CBarVisibilityController> m_bar;

    SP<CSwipeTransition>         m_swipeTransition;
    SP<CSwipeTransition>         m_tapTransition;

    struct {
        CHyprSignalListener selectionChanged;
        CHyprSignalListener swipeCommitted;
        CHyprSignalListener transitionStarted;
        CHyprSignalListener transitionFinished;
        CHyprSignalListener configReloaded;
    } m_listeners;
};
