#include "ITabTransition.hpp"
#include "../TransitionContext.hpp"
#include "../../config/ConfigManager.hpp"

ITabTransition::ITabTransition(const std::string& animationNode) : m_animationNode(animationNode) {
    ;
}

const std::string& ITabTransition::animationNode() const {
    return m_animationNode;
}

void ITabTransition::animateTransition(SP<CTransitionContext> ctx) {
    if (!ctx)
        return;

    Log::logger->log(Log::DEBUG, "ITabTransition: {} -> {} on {}, fromLeft {}, interactive {}", ctx->m_fromIndex, ctx->m_toIndex, m_animationNode, m_fromLeft,
                     ctx->isInteractive());

    if (m_start)
        m_start();

    prepare(ctx);

    // the style outlives its contexts, the container holds both until completion
    WP<CTransitionContext> weak = ctx;
    ctx->runAnimation(
        g_pConfigManager->getAnimationPropertyConfig(m_animationNode),
        [this, weak](float progress) {
            if (const auto CTX = weak.lock())
                step(CTX, progress);
        },
        [this, weak]() {
            const auto CTX = weak.lock();
            if (!CTX)
                return;

            const bool CANCELLED = CTX->transitionWasCancelled();

            finalize(CTX, CANCELLED);

            if (m_finish)
                m_finish();

            CTX->completeTransition(!CANCELLED);
        });
}
