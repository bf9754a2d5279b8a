#include "PercentDrivenTransition.hpp"
#include "TransitionContext.hpp"
#include "transitions/ITabTransition.hpp"

void CPercentDrivenTransition::startInteractiveTransition(SP<CTransitionContext> ctx, SP<ITabTransition> animator) {
    if (!ctx || !animator)
        return;

    m_context = ctx;
    m_percent = 0.F;

    animator->animateTransition(ctx);
}

void CPercentDrivenTransition::update(float percent) {
    m_percent = percent;

    if (const auto CTX = m_context.lock())
        CTX->updateInteractiveTransition(percent);
}

void CPercentDrivenTransition::finish() {
    const auto CTX = m_context.lock();
    m_context.reset();

    if (!CTX) {
        Log::logger->log(Log::TRACE, "CPercentDrivenTransition::finish: nothing to finish");
        return;
    }

    CTX->finishInteractiveTransition();
}

void CPercentDrivenTransition::cancel() {
    const auto CTX = m_context.lock();
    m_context.reset();

    if (!CTX) {
        Log::logger->log(Log::TRACE, "CPercentDrivenTransition::cancel: nothing to cancel");
        return;
    }

    CTX->cancelInteractiveTransition();
}

float CPercentDrivenTransition::percentComplete() const {
    return m_percent;
}

bool CPercentDrivenTransition::isDriving() const {
    return !m_context.expired();
}
