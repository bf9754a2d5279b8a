#pragma once

#include <functional>
#include <string>

#include "../TabTypes.hpp"
#include "../../defines.hpp"

// Base of the page switch animation styles.
// animateTransition() brackets every run with m_start and m_finish, exactly once each,
// whether the run completes or is cancelled.
class ITabTransition {
  public:
    virtual ~ITabTransition() = default;

    void                  animateTransition(SP<CTransitionContext> ctx);

    const std::string&    animationNode() const;

    bool                  m_fromLeft = false;

    std::function<void()> m_start;
    std::function<void()> m_finish;

  protected:
    ITabTransition(const std::string& animationNode);

    virtual void prepare(SP<CTransitionContext> ctx)                   = 0;
    virtual void step(SP<CTransitionContext> ctx, float progress)      = 0;
    virtual void finalize(SP<CTransitionContext> ctx, bool cancelled) = 0;

    std::string  m_animationNode;
};
