#include "TransitionCoordinator.hpp"
#include "PercentDrivenTransition.hpp"
#include "transitions/ITabTransition.hpp"
#include "../managers/input/SwipeInteractor.hpp"

CTransitionCoordinator::CTransitionCoordinator(WP<ITabContainer> container) : m_container(container) {
    ;
}

CTransitionCoordinator::~CTransitionCoordinator() {
    // styles can outlive us, their hooks point back here
    for (auto const& s : {m_swipeStyle, m_tapStyle}) {
        if (!s)
            continue;

        s->m_start  = nullptr;
        s->m_finish = nullptr;
    }
}

void CTransitionCoordinator::hookStyle(SP<ITabTransition> style) {
    if (!style)
        return;

    style->m_start  = [this] { m_events.transitionStarted.emit(); };
    style->m_finish = [this] { m_events.transitionFinished.emit(); };
}

void CTransitionCoordinator::unhookStyle(SP<ITabTransition> style) {
    if (!style || style == m_swipeStyle || style == m_tapStyle)
        return;

    style->m_start  = nullptr;
    style->m_finish = nullptr;
}

void CTransitionCoordinator::setSwipeStyle(SP<ITabTransition> style) {
    const auto OLD        = m_swipeStyle;
    const bool WASCURRENT = m_currentStyle == OLD;

    m_swipeStyle = style;
    hookStyle(style);
    unhookStyle(OLD);

    if (WASCURRENT || !m_currentStyle)
        m_currentStyle = m_swipeStyle;
}

void CTransitionCoordinator::setTapStyle(SP<ITabTransition> style) {
    const auto OLD        = m_tapStyle;
    const bool WASCURRENT = m_currentStyle && m_currentStyle == OLD;

    m_tapStyle = style;
    hookStyle(style);
    unhookStyle(OLD);

    if (WASCURRENT)
        m_currentStyle = m_tapStyle;
}

void CTransitionCoordinator::setInteractor(WP<CSwipeInteractor> interactor) {
    m_interactor = interactor;
}

void CTransitionCoordinator::selectTransitionStyle(bool originatedBySwipe) {
    m_currentStyle = originatedBySwipe ? m_swipeStyle : m_tapStyle;
}

SP<ITabTransition> CTransitionCoordinator::provideAnimationController(PHLPAGE from, PHLPAGE to) {
    const auto PCONTAINER = m_container.lock();
    if (!PCONTAINER)
        return nullptr;

    const auto FROMIDX = PCONTAINER->indexOf(from);
    const auto TOIDX   = PCONTAINER->indexOf(to);

    if (!FROMIDX.has_value() || !TOIDX.has_value()) {
        Log::logger->log(Log::DEBUG, "CTransitionCoordinator: unresolvable endpoints, switching without animation");
        return nullptr;
    }

    if (!m_currentStyle)
        return nullptr;

    m_touchesFirstPage         = *FROMIDX == 0 || *TOIDX == 0;
    m_currentStyle->m_fromLeft = *FROMIDX > *TOIDX;

    m_lastIntent = STransitionIntent{
        .fromIndex       = *FROMIDX,
        .toIndex         = *TOIDX,
        .swipeOriginated = m_currentStyle == m_swipeStyle,
    };

    return m_currentStyle;
}

SP<CPercentDrivenTransition> CTransitionCoordinator::provideInteractionController() {
    const auto PINTERACTOR = m_interactor.lock();
    if (!PINTERACTOR || !PINTERACTOR->interactionInProgress())
        return nullptr;

    return PINTERACTOR->progressDriver();
}

SP<ITabTransition> CTransitionCoordinator::animationControllerFor(PHLPAGE from, PHLPAGE to) {
    return provideAnimationController(from, to);
}

SP<CPercentDrivenTransition> CTransitionCoordinator::interactionControllerFor(SP<ITabTransition> animator) {
    return provideInteractionController();
}

bool CTransitionCoordinator::shouldSelect(PHLPAGE page) {
    selectTransitionStyle(false);
    return true;
}

void CTransitionCoordinator::didSelect(PHLPAGE page) {
    selectTransitionStyle(true);
}

std::expected<void, std::string> CTransitionCoordinator::requestSelection(size_t index) {
    const auto PCONTAINER = m_container.lock();
    if (!PCONTAINER)
        return std::unexpected("no container");

    return PCONTAINER->setSelectedIndex(index);
}

size_t CTransitionCoordinator::selectedIndex() const {
    const auto PCONTAINER = m_container.lock();
    return PCONTAINER ? PCONTAINER->selectedIndex() : 0;
}

size_t CTransitionCoordinator::pageCount() const {
    const auto PCONTAINER = m_container.lock();
    return PCONTAINER ? PCONTAINER->pages().size() : 0;
}

double CTransitionCoordinator::containerWidth() const {
    return containerBox().w;
}

CBox CTransitionCoordinator::containerBox() const {
    const auto PCONTAINER = m_container.lock();
    return PCONTAINER ? PCONTAINER->containerBox() : CBox{};
}

bool CTransitionCoordinator::touchesFirstPage() const {
    return m_touchesFirstPage;
}

const std::optional<STransitionIntent>& CTransitionCoordinator::lastIntent() const {
    return m_lastIntent;
}

SP<ITabTransition> CTransitionCoordinator::currentStyle() const {
    return m_currentStyle;
}

SP<ITabTransition> CTransitionCoordinator::swipeStyle() const {
    return m_swipeStyle;
}

SP<ITabTransition> CTransitionCoordinator::tapStyle() const {
    return m_tapStyle;
}
