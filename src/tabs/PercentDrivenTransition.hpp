#pragma once

#include "TabTypes.hpp"
#include "../defines.hpp"

class ITabTransition;

// Drives a transition context from outside, by fraction, instead of letting it animate on its own.
class CPercentDrivenTransition {
  public:
    void  startInteractiveTransition(SP<CTransitionContext> ctx, SP<ITabTransition> animator);

    void  update(float percent);
    void  finish();
    void  cancel();

    float percentComplete() const;
    bool  isDriving() const;

  private:
    WP<CTransitionContext> m_context;
    float                  m_percent = 0.F;
};
