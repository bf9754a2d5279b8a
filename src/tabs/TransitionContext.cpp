#include "TransitionContext.hpp"
#include "TabPage.hpp"
#include "../managers/animation/AnimationManager.hpp"

#include <algorithm>

SP<CTransitionContext> CTransitionContext::create(PHLPAGE from, PHLPAGE to, size_t fromIndex, size_t toIndex, const CBox& containerBox, bool interactive) {
    const auto CTX = makeShared<CTransitionContext>(from, to, fromIndex, toIndex, containerBox, interactive);
    CTX->m_self    = CTX;
    return CTX;
}

CTransitionContext::CTransitionContext(PHLPAGE from, PHLPAGE to, size_t fromIndex, size_t toIndex, const CBox& containerBox, bool interactive) :
    m_from(from), m_to(to), m_fromIndex(fromIndex), m_toIndex(toIndex), m_containerBox(containerBox), m_interactive(interactive) {
    ;
}

CTransitionContext::~CTransitionContext() {
    if (!m_completed)
        Log::logger->log(Log::TRACE, "CTransitionContext: {} -> {} dropped before completing", m_fromIndex, m_toIndex);
}

void CTransitionContext::runAnimation(SP<Hyprutils::Animation::SAnimationPropertyConfig> config, StepFn step, std::function<void()> done) {
    if (m_progress) {
        Log::logger->log(Log::ERR, "CTransitionContext: runAnimation called twice for {} -> {}", m_fromIndex, m_toIndex);
        return;
    }

    m_step = std::move(step);
    m_done = std::move(done);

    g_pAnimationManager->createAnimation(0.F, m_progress, config, AVARDAMAGE_NONE);

    m_progress->setUpdateCallback([WEAK = m_self](auto) {
        if (const auto CTX = WEAK.lock())
            CTX->onProgress(CTX->m_progress->value());
    });

    onProgress(0.F);

    if (!m_interactive) {
        m_settling = true;
        settleTo(1.F);
    }
}

bool CTransitionContext::animateAlongside(StepFn step, CompletionFn completion) {
    if (m_completed)
        return false;

    if (step)
        step(progress());

    m_alongside.emplace_back(SAlongside{.step = std::move(step), .completion = std::move(completion)});
    return true;
}

void CTransitionContext::updateInteractiveTransition(float percent) {
    if (!m_interactive || m_settling || m_completed || !m_progress)
        return;

    // no end callback is set while tracking, so warping here does not settle anything
    m_progress->setValueAndWarp(std::clamp(percent, 0.F, 1.F));
}

void CTransitionContext::finishInteractiveTransition() {
    if (m_settling || m_completed || !m_progress)
        return;

    m_settling  = true;
    m_cancelled = false;
    settleTo(1.F);
}

void CTransitionContext::cancelInteractiveTransition() {
    if (m_settling || m_completed || !m_progress)
        return;

    m_settling  = true;
    m_cancelled = true;
    settleTo(0.F);
}

void CTransitionContext::settleTo(float target) {
    // assigning the current goal is a no-op and would never call back
    if (m_progress->value() == target) {
        onProgress(target);
        onSettled();
        return;
    }

    m_progress->setCallbackOnEnd([WEAK = m_self](auto) {
        if (const auto CTX = WEAK.lock())
            CTX->onSettled();
    });

    *m_progress = target;
}

void CTransitionContext::onProgress(float progress) {
    if (m_step)
        m_step(progress);

    for (auto const& a : m_alongside) {
        if (a.step)
            a.step(progress);
    }
}

void CTransitionContext::onSettled() {
    if (m_completed)
        return;

    if (m_done)
        m_done();
    else
        completeTransition(!m_cancelled);
}

void CTransitionContext::completeTransition(bool didComplete) {
    if (m_completed)
        return;

    // listeners may drop the last owning reference
    const auto SELF = m_self.lock();

    m_completed = true;
    m_cancelled = !didComplete;

    for (auto const& a : m_alongside) {
        if (a.completion)
            a.completion(m_cancelled);
    }

    m_events.completed.emit(m_cancelled);
}

bool CTransitionContext::isInteractive() const {
    return m_interactive;
}

bool CTransitionContext::transitionWasCancelled() const {
    return m_cancelled;
}

bool CTransitionContext::isCompleted() const {
    return m_completed;
}

bool CTransitionContext::isSettling() const {
    return m_settling;
}

float CTransitionContext::progress() const {
    return m_progress ? m_progress->value() : 0.F;
}
