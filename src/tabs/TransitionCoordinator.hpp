#pragma once

#include "ITabContainer.hpp"

class CSwipeInteractor;

struct STransitionIntent {
    size_t fromIndex       = 0;
    size_t toIndex         = 0;
    bool   swipeOriginated = true;
};

// Container delegate. Keeps one current style per switch: swipe by default, tap once
// shouldSelect() has run.
//
// shouldSelect() and didSelect() are the only writers of the current style. The container asks
// for an animation controller right after one of them within the same dispatch, so a read never
// sees a half-made decision.
class CTransitionCoordinator : public ITabContainerDelegate {
  public:
    CTransitionCoordinator(WP<ITabContainer> container);
    virtual ~CTransitionCoordinator();

    void                                     setSwipeStyle(SP<ITabTransition> style);
    void                                     setTapStyle(SP<ITabTransition> style);
    void                                     setInteractor(WP<CSwipeInteractor> interactor);

    void                                     selectTransitionStyle(bool originatedBySwipe);
    SP<ITabTransition>                       provideAnimationController(PHLPAGE from, PHLPAGE to);
    SP<CPercentDrivenTransition>             provideInteractionController();

    virtual SP<ITabTransition>               animationControllerFor(PHLPAGE from, PHLPAGE to);
    virtual SP<CPercentDrivenTransition>     interactionControllerFor(SP<ITabTransition> animator);
    virtual bool                             shouldSelect(PHLPAGE page);
    virtual void                             didSelect(PHLPAGE page);

    // the interactor's way into the container
    std::expected<void, std::string>         requestSelection(size_t index);
    size_t                                   selectedIndex() const;
    size_t                                   pageCount() const;
    double                                   containerWidth() const;
    CBox                                     containerBox() const;

    bool                                     touchesFirstPage() const;
    const std::optional<STransitionIntent>&  lastIntent() const;
    SP<ITabTransition>                       currentStyle() const;
    SP<ITabTransition>                       swipeStyle() const;
    SP<ITabTransition>                       tapStyle() const;

    struct {
        CSignalT<> transitionStarted;
        CSignalT<> transitionFinished;
    } m_events;

  private:
    void                             hookStyle(SP<ITabTransition> style);
    void                             unhookStyle(SP<ITabTransition> style);

    WP<ITabContainer>                m_container;
    WP<CSwipeInteractor>             m_interactor;

    SP<ITabTransition>               m_swipeStyle;
    SP<ITabTransition>               m_tapStyle;
    SP<ITabTransition>               m_currentStyle;

    bool                             m_touchesFirstPage = false;
    std::optional<STransitionIntent> m_lastIntent;
};
