#include "SwipeInteractor.hpp"
#include "../../tabs/TabPage.hpp"
#include "../../tabs/TransitionCoordinator.hpp"
#include "../../tabs/PercentDrivenTransition.hpp"

#include <algorithm>
#include <cmath>
#include <vector>

constexpr double Y_TRANSLATION_FOR_SUSPEND     = 5.0;
constexpr double Y_VELOCITY_FOR_SUSPEND        = 100.0;
constexpr double X_VELOCITY_FOR_COMPLETE       = 200.0;
constexpr double X_TRANSLATION_FOR_RECOGNITION = 5.0;
constexpr double COMPLETION_FRACTION           = 0.5;
constexpr double FRACTION_CEILING              = 0.99;

CSwipeInteractor::CSwipeInteractor(WP<CTransitionCoordinator> coordinator) : m_coordinator(coordinator), m_driver(makeShared<CPercentDrivenTransition>()) {
    ;
}

CSwipeInteractor::~CSwipeInteractor() {
    // recognizers might outlive us in a caller's local copy, make sure they can't call back
    for (auto const& [id, pair] : m_recognizers) {
        for (auto const& r : {pair.left, pair.right}) {
            r->setHandler({});
            r->setBeginGate({});
            r->setEnabled(false);
        }
    }

    if (m_interactionSource)
        m_interactionSource->setHandler({});
}

void CSwipeInteractor::wireTo(PHLPAGE page) {
    if (!page)
        return;

    const auto CONTENT = page->firstContent();

    pruneDeadPairs();

    if (m_recognizers.erase(CONTENT->m_id))
        Log::logger->log(Log::TRACE, "CSwipeInteractor: dropped the old recognizers of page {}", CONTENT->m_name);

    auto makeRecognizer = [this](eScreenEdge edge) {
        auto                   r    = makeShared<CEdgePanRecognizer>(edge, nullptr);
        WP<CEdgePanRecognizer> weak = r;
        r->setHandler([this, weak](const SSwipeSample& s) {
            if (const auto SOURCE = weak.lock())
                handlePanFrom(SOURCE, s);
        });
        r->setBeginGate([this](const CEdgePanRecognizer& self) {
            // one drag at a time, whichever page the other touch went down on
            if (interactionActive())
                return false;

            const auto PAIR = pairOwning(self);
            if (!PAIR)
                return true;

            const auto& OTHER = PAIR->left.get() == &self ? PAIR->right : PAIR->left;
            if (!OTHER->hasBegun())
                return true;

            return shouldRecognizeSimultaneously(*OTHER);
        });
        r->setEnabled(m_enabled);
        return r;
    };

    m_recognizers[CONTENT->m_id] = SRecognizerPair{
        .page  = CONTENT,
        .left  = makeRecognizer(SCREEN_EDGE_LEFT),
        .right = makeRecognizer(SCREEN_EDGE_RIGHT),
    };

    m_boundPage = CONTENT;

    Log::logger->log(Log::DEBUG, "CSwipeInteractor: wired to page {} (id {})", CONTENT->m_name, CONTENT->m_id);
}

void CSwipeInteractor::pruneDeadPairs() {
    std::erase_if(m_recognizers, [](const auto& el) { return el.second.page.expired(); });
}

const CSwipeInteractor::SRecognizerPair* CSwipeInteractor::pairOwning(const CEdgePanRecognizer& recognizer) const {
    for (auto const& [id, pair] : m_recognizers) {
        if (pair.left.get() == &recognizer || pair.right.get() == &recognizer)
            return &pair;
    }

    return nullptr;
}

bool CSwipeInteractor::shouldRecognizeSimultaneously(const CEdgePanRecognizer& recognizer) const {
    const auto PPAGE = m_boundPage.lock();
    if (!PPAGE)
        return true;

    const auto IT = m_recognizers.find(PPAGE->m_id);
    if (IT == m_recognizers.end())
        return true;

    if (IT->second.left.get() != &recognizer && IT->second.right.get() != &recognizer)
        return true;

    return std::abs(recognizer.translation().x) < X_TRANSLATION_FOR_RECOGNITION;
}

bool CSwipeInteractor::shouldSuspendInteraction(const SSwipeSample& sample) const {
    if (m_diagonalSwipe)
        return false;

    return std::abs(sample.translation.y) > Y_TRANSLATION_FOR_SUSPEND || std::abs(sample.velocity.y) > Y_VELOCITY_FOR_SUSPEND;
}

bool CSwipeInteractor::interactionActive() const {
    return m_inProgress || m_driver->isDriving();
}

void CSwipeInteractor::handlePanFrom(SP<CEdgePanRecognizer> source, const SSwipeSample& sample) {
    if (sample.phase == SWIPE_PHASE_BEGAN) {
        if (interactionActive())
            return;

        m_interactionSource = source;
        handlePan(sample);
        return;
    }

    // a touch that began while another one was suspended must not drive the live interaction
    if (m_interactionSource != source)
        return;

    if (sample.phase == SWIPE_PHASE_ENDED || sample.phase == SWIPE_PHASE_CANCELLED)
        m_interactionSource.reset();

    handlePan(sample);
}

void CSwipeInteractor::handlePan(const SSwipeSample& sample) {
    switch (sample.phase) {
        case SWIPE_PHASE_BEGAN: onBegan(sample); break;
        case SWIPE_PHASE_CHANGED: onChanged(sample); break;
        case SWIPE_PHASE_ENDED:
        case SWIPE_PHASE_CANCELLED: onReleased(sample); break;
    }
}

void CSwipeInteractor::onBegan(const SSwipeSample& sample) {
    if (interactionActive()) {
        Log::logger->log(Log::DEBUG, "CSwipeInteractor: ignoring a new gesture, an interactive switch is still running");
        return;
    }

    m_events.gestureStarted.emit();

    m_inProgress     = false;
    m_rightToLeft    = false;
    m_shouldComplete = false;
    m_suspended      = false;

    if (shouldSuspendInteraction(sample)) {
        Log::logger->log(Log::TRACE, "CSwipeInteractor: gesture is diagonal ({}, {} px/s), suspending", sample.translation, sample.velocity);
        m_suspended = true;
        return;
    }

    const auto PCOORD = m_coordinator.lock();
    if (!PCOORD)
        return;

    m_rightToLeft = sample.velocity.x < 0;

    const auto CURRENT = PCOORD->selectedIndex();

    // only the first two pages take part in swipes
    if ((m_rightToLeft && CURRENT != 0) || (!m_rightToLeft && CURRENT != 1)) {
        Log::logger->log(Log::TRACE, "CSwipeInteractor: {} swipe from page {} isn't eligible", m_rightToLeft ? "right-to-left" : "left-to-right", CURRENT);
        return;
    }

    size_t target = CURRENT;
    if (m_rightToLeft) {
        if (CURRENT + 1 >= PCOORD->pageCount())
            return;
        target = CURRENT + 1;
    } else {
        if (CURRENT == 0)
            return;
        target = CURRENT - 1;
    }

    // the container asks for the interaction controller while selecting, so this has to be set first
    m_inProgress = true;

    if (auto res = PCOORD->requestSelection(target); !res) {
        Log::logger->log(Log::DEBUG, "CSwipeInteractor: container refused page {}: {}", target, res.error());
        m_inProgress = false;
        return;
    }

    Log::logger->log(Log::DEBUG, "CSwipeInteractor: interactive switch {} -> {}", CURRENT, target);
}

void CSwipeInteractor::onChanged(const SSwipeSample& sample) {
    if (!m_inProgress)
        return;

    const auto PCOORD = m_coordinator.lock();
    if (!PCOORD)
        return;

    const double WIDTH = PCOORD->containerWidth();
    if (WIDTH <= 0)
        return;

    const double TRANSLATIONVALUE = sample.translation.x / WIDTH;

    // dragging back past the origin doesn't start the other direction
    if ((m_rightToLeft && TRANSLATIONVALUE > 0) || (!m_rightToLeft && TRANSLATIONVALUE < 0)) {
        m_driver->update(0.F);
        return;
    }

    const double FRACTION = std::clamp(std::abs(TRANSLATIONVALUE), 0.0, FRACTION_CEILING);
    m_shouldComplete      = FRACTION > COMPLETION_FRACTION;

    m_driver->update(FRACTION);
}

void CSwipeInteractor::onReleased(const SSwipeSample& sample) {
    if (!m_inProgress)
        return;

    m_inProgress = false;
    m_events.gestureFinished.emit();

    if (!m_shouldComplete) {
        if ((m_rightToLeft && sample.velocity.x < -X_VELOCITY_FOR_COMPLETE) || (!m_rightToLeft && sample.velocity.x > X_VELOCITY_FOR_COMPLETE))
            m_shouldComplete = true;
    }

    if (!m_shouldComplete || sample.phase == SWIPE_PHASE_CANCELLED) {
        Log::logger->log(Log::DEBUG, "CSwipeInteractor: rolling back at {:.2f}", m_driver->percentComplete());
        m_driver->cancel();
        return;
    }

    Log::logger->log(Log::DEBUG, "CSwipeInteractor: committing at {:.2f}", m_driver->percentComplete());
    m_driver->finish();
    m_events.transitionFinished.emit();
}

void CSwipeInteractor::onTouchDown(const STouchEvent& e) {
    const auto PPAGE  = m_boundPage.lock();
    const auto PCOORD = m_coordinator.lock();
    if (!PPAGE || !PCOORD)
        return;

    const auto IT = m_recognizers.find(PPAGE->m_id);
    if (IT == m_recognizers.end())
        return;

    // copies, the callbacks can rewire and drop this pair
    const auto LEFT  = IT->second.left;
    const auto RIGHT = IT->second.right;
    const auto BOX   = PCOORD->containerBox();

    if (LEFT->touchDown(e, BOX) || RIGHT->touchDown(e, BOX))
        m_touchOwners[e.touchID] = PPAGE->m_id;
}

void CSwipeInteractor::onTouchMotion(const STouchEvent& e) {
    const auto OWNER = m_touchOwners.find(e.touchID);
    if (OWNER == m_touchOwners.end())
        return;

    const auto IT = m_recognizers.find(OWNER->second);
    if (IT == m_recognizers.end()) {
        m_touchOwners.erase(OWNER);
        return;
    }

    const auto LEFT  = IT->second.left;
    const auto RIGHT = IT->second.right;

    LEFT->touchMotion(e);
    RIGHT->touchMotion(e);
}

void CSwipeInteractor::onTouchUp(const STouchEvent& e) {
    const auto OWNER = m_touchOwners.find(e.touchID);
    if (OWNER == m_touchOwners.end())
        return;

    const auto PAGEID = OWNER->second;
    m_touchOwners.erase(OWNER);

    const auto IT = m_recognizers.find(PAGEID);
    if (IT == m_recognizers.end())
        return;

    const auto LEFT  = IT->second.left;
    const auto RIGHT = IT->second.right;

    LEFT->touchUp(e);
    RIGHT->touchUp(e);
}

void CSwipeInteractor::onTouchCancel(const STouchEvent& e) {
    const auto OWNER = m_touchOwners.find(e.touchID);
    if (OWNER == m_touchOwners.end())
        return;

    const auto PAGEID = OWNER->second;
    m_touchOwners.erase(OWNER);

    const auto IT = m_recognizers.find(PAGEID);
    if (IT == m_recognizers.end())
        return;

    const auto LEFT  = IT->second.left;
    const auto RIGHT = IT->second.right;

    LEFT->touchCancel(e);
    RIGHT->touchCancel(e);
}

void CSwipeInteractor::setEnabled(bool enabled) {
    m_enabled = enabled;

    if (!enabled)
        m_touchOwners.clear();

    // disabling cancels a running drag, and the rollback rewires, so walk a copy
    std::vector<SP<CEdgePanRecognizer>> recognizers;
    recognizers.reserve(m_recognizers.size() * 2);
    for (auto const& [id, pair] : m_recognizers) {
        recognizers.emplace_back(pair.left);
        recognizers.emplace_back(pair.right);
    }

    for (auto const& r : recognizers) {
        r->setEnabled(enabled);
    }
}

bool CSwipeInteractor::isEnabled() const {
    return m_enabled;
}

void CSwipeInteractor::setDiagonalSwipe(bool enabled) {
    m_diagonalSwipe = enabled;
}

bool CSwipeInteractor::isDiagonalSwipeEnabled() const {
    return m_diagonalSwipe;
}

bool CSwipeInteractor::interactionInProgress() const {
    return m_inProgress;
}

bool CSwipeInteractor::shouldComplete() const {
    return m_shouldComplete;
}

bool CSwipeInteractor::isRightToLeft() const {
    return m_rightToLeft;
}

bool CSwipeInteractor::isSuspended() const {
    return m_suspended;
}

SP<CPercentDrivenTransition> CSwipeInteractor::progressDriver() const {
    return m_driver;
}

PHLPAGE CSwipeInteractor::boundPage() const {
    return m_boundPage.lock();
}

size_t CSwipeInteractor::registeredPairs() const {
    return m_recognizers.size();
}

bool CSwipeInteractor::hasRecognizersFor(PHLPAGE page) const {
    return page && m_recognizers.contains(page->firstContent()->m_id);
}

SP<CEdgePanRecognizer> CSwipeInteractor::recognizerFor(PHLPAGE page, eScreenEdge edge) const {
    if (!page)
        return nullptr;

    const auto IT = m_recognizers.find(page->firstContent()->m_id);
    if (IT == m_recognizers.end())
        return nullptr;

    return edge == SCREEN_EDGE_LEFT ? IT->second.left : IT->second.right;
}
