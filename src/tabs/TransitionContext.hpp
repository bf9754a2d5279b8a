#pragma once

#include <algorithm>
#include <functional>
#include <vector>

#include <hyprutils/animation/AnimationConfig.hpp>

#include "TabTypes.hpp"
#include "../defines.hpp"
#include "../helpers/AnimatedVariable.hpp"

// Shared state of one page switch. Owns the progress variable (0 at from, 1 at to) that
// the transition style and everything animated alongside it follow.
class CTransitionContext {
  public:
    using StepFn       = std::function<void(float progress)>;
    using CompletionFn = std::function<void(bool cancelled)>;

    static SP<CTransitionContext> create(PHLPAGE from, PHLPAGE to, size_t fromIndex, size_t toIndex, const CBox& containerBox, bool interactive);

    // use create() don't use this
    CTransitionContext(PHLPAGE from, PHLPAGE to, size_t fromIndex, size_t toIndex, const CBox& containerBox, bool interactive);
    ~CTransitionContext();

    // called once by the style. Non-interactive runs animate straight to 1,
    // interactive ones wait for the driver. done runs when progress has settled.
    void  runAnimation(SP<Hyprutils::Animation::SAnimationPropertyConfig> config, StepFn step, std::function<void()> done);

    // false if the transition is already over
    bool  animateAlongside(StepFn step, CompletionFn completion);

    void  updateInteractiveTransition(float percent);
    void  finishInteractiveTransition();
    void  cancelInteractiveTransition();

    void  completeTransition(bool didComplete);

    bool  isInteractive() const;
    bool  transitionWasCancelled() const;
    bool  isCompleted() const;
    bool  isSettling() const;
    float progress() const;

    PHLPAGE                    m_from, m_to;
    size_t                     m_fromIndex = 0, m_toIndex = 0;
    CBox                       m_containerBox;

    WP<CTransitionContext>     m_self;

    struct {
        // arg: cancelled
        CSignalT<bool> completed;
    } m_events;

  private:
    void              settleTo(float target);
    void              onProgress(float progress);
    void              onSettled();

    PHLANIMVAR<float> m_progress;

    StepFn            m_step;
    std::function<void()> m_done;

    struct SAlongside {
        StepFn       step;
        CompletionFn completion;
    };
    std::vector<SAlongside> m_alongside;

    bool                    m_interactive = false;
    bool                    m_cancelled   = false;
    bool                    m_settling    = false;
    bool                    m_completed   = false;
};
