#pragma once

#include "ITabContainer.hpp"

// Slides the container's tab bar out of (and back into) view.
class CBarVisibilityController {
  public:
    CBarVisibilityController(WP<ITabContainer> container);

    // no-op when the bar already is in the requested state. With along set, the bar follows
    // that transition's progress instead of running its own animation.
    void setHidden(bool hidden, bool animated = true, SP<CTransitionContext> along = nullptr);
    bool isHidden() const;

    void onTransitionStart(bool touchesFirstPage);
    void onTransitionFinish();

    void setChoreographyEnabled(bool enabled);
    bool choreographyEnabled() const;

  private:
    WP<ITabContainer> m_container;
    bool              m_choreographyEnabled = true;
};
