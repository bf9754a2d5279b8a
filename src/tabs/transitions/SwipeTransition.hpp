#pragma once

#include <optional>

#include "ITabTransition.hpp"

enum eSwipeAnimationType : uint8_t {
    SWIPE_ANIMATION_SIDE_BY_SIDE = 0,
    SWIPE_ANIMATION_OVERLAP,
    SWIPE_ANIMATION_PUSH,
    SWIPE_ANIMATION_FADE,
};

std::optional<eSwipeAnimationType> swipeAnimationTypeFromString(const std::string& style);

class CSwipeTransition : public ITabTransition {
  public:
    CSwipeTransition(const std::string& animationNode, std::optional<eSwipeAnimationType> type = std::nullopt);
    virtual ~CSwipeTransition() = default;

    // an explicit type wins over the style set on the animation node
    void                setAnimationType(std::optional<eSwipeAnimationType> type);
    eSwipeAnimationType animationType() const;

  protected:
    virtual void prepare(SP<CTransitionContext> ctx);
    virtual void step(SP<CTransitionContext> ctx, float progress);
    virtual void finalize(SP<CTransitionContext> ctx, bool cancelled);

  private:
    std::optional<eSwipeAnimationType> m_type;

    // locked in at prepare(), so a config reload can't change a running switch
    eSwipeAnimationType m_runningType = SWIPE_ANIMATION_SIDE_BY_SIDE;
};
