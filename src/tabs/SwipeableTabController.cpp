#include "SwipeableTabController.hpp"
#include "TabPage.hpp"
#include "../config/ConfigManager.hpp"
#include "../config/ConfigValue.hpp"

CSwipeableTabController::CSwipeableTabController(const CBox& box, double barHeight) {
    m_container   = makeShared<CTabContainer>(box, barHeight);
    m_coordinator = makeShared<CTransitionCoordinator>(m_container);
    m_interactor  = makeShared<CSwipeInteractor>(m_coordinator);
    m_bar         = makeUnique<CBarVisibilityController>(m_container);

    m_swipeTransition = makeShared<CSwipeTransition>("tabsSwipe");
    m_tapTransition   = makeShared<CSwipeTransition>("tabsTap");

    m_coordinator->setSwipeStyle(m_swipeTransition);
    m_coordinator->setTapStyle(m_tapTransition);
    m_coordinator->setInteractor(m_interactor);
    m_container->setDelegate(m_coordinator);

    m_listeners.selectionChanged = m_container->m_events.selectionChanged.listen([this] {
        if (const auto PPAGE = m_container->selectedPage(); PPAGE)
            m_interactor->wireTo(PPAGE);
    });

    m_listeners.swipeCommitted = m_interactor->m_events.transitionFinished.listen([this] { m_container->notifyDidSelect(); });

    m_listeners.transitionStarted  = m_coordinator->m_events.transitionStarted.listen([this] { m_bar->onTransitionStart(m_coordinator->touchesFirstPage()); });
    m_listeners.transitionFinished = m_coordinator->m_events.transitionFinished.listen([this] { m_bar->onTransitionFinish(); });

    if (g_pConfigManager)
        m_listeners.configReloaded = g_pConfigManager->m_events.reloaded.listen([this] { applyConfig(); });

    applyConfig();
}

CSwipeableTabController::~CSwipeableTabController() {
    // drop the delegate before the coordinator goes, a settling switch could still ask it things
    m_container->setDelegate({});
}

void CSwipeableTabController::applyConfig() {
    if (!g_pConfigManager)
        return;

    static auto PSWIPEENABLED = CConfigValue<Hyprlang::INT>("tabs:swipe_enabled");
    static auto PDIAGONAL     = CConfigValue<Hyprlang::INT>("tabs:diagonal_swipe");
    static auto PHIDEBAR      = CConfigValue<Hyprlang::INT>("tabs:hide_bar_on_first_page");

    setSwipeEnabled(*PSWIPEENABLED);
    setDiagonalSwipe(*PDIAGONAL);
    m_bar->setChoreographyEnabled(*PHIDEBAR);
}

std::expected<void, std::string> CSwipeableTabController::setPages(const std::vector<PHLPAGE>& pages, size_t selected) {
    return m_container->setPages(pages, selected);
}

void CSwipeableTabController::setSwipeAnimation(std::optional<eSwipeAnimationType> type) {
    const auto PSTYLE = dynamicPointerCast<CSwipeTransition>(m_coordinator->swipeStyle());
    if (!PSTYLE) {
        Log::logger->log(Log::WARN, "setSwipeAnimation: the swipe style isn't a swipe transition, ignoring");
        return;
    }

    PSTYLE->setAnimationType(type);
}

void CSwipeableTabController::setTapAnimation(std::optional<eSwipeAnimationType> type) {
    const auto PSTYLE = dynamicPointerCast<CSwipeTransition>(m_coordinator->tapStyle());
    if (!PSTYLE) {
        Log::logger->log(Log::WARN, "setTapAnimation: the tap style isn't a swipe transition, ignoring");
        return;
    }

    PSTYLE->setAnimationType(type);
}

void CSwipeableTabController::setAnimationTransitioning(SP<ITabTransition> swipe, SP<ITabTransition> tap) {
    if (!swipe) {
        Log::logger->log(Log::WARN, "setAnimationTransitioning: null swipe style, ignoring");
        return;
    }

    m_coordinator->setSwipeStyle(swipe);

    if (tap)
        m_coordinator->setTapStyle(tap);
}

void CSwipeableTabController::setDiagonalSwipe(bool enabled) {
    m_interactor->setDiagonalSwipe(enabled);
}

bool CSwipeableTabController::isDiagonalSwipeEnabled() const {
    return m_interactor->isDiagonalSwipeEnabled();
}

void CSwipeableTabController::setSwipeEnabled(bool enabled) {
    m_interactor->setEnabled(enabled);
}

bool CSwipeableTabController::isSwipeEnabled() const {
    return m_interactor->isEnabled();
}

void CSwipeableTabController::setTabBarHidden(bool hidden, bool animated, SP<CTransitionContext> along) {
    m_bar->setHidden(hidden, animated, along);
}

bool CSwipeableTabController::isTabBarHidden() const {
    return m_bar->isHidden();
}

void CSwipeableTabController::onTouchDown(const STouchEvent& e) {
    m_interactor->onTouchDown(e);
}

void CSwipeableTabController::onTouchMotion(const STouchEvent& e) {
    m_interactor->onTouchMotion(e);
}

void CSwipeableTabController::onTouchUp(const STouchEvent& e) {
    m_interactor->onTouchUp(e);
}

void CSwipeableTabController::onTouchCancel(const STouchEvent& e) {
    m_interactor->onTouchCancel(e);
}

SP<CTabContainer> CSwipeableTabController::container() const {
    return m_container;
}

SP<CTransitionCoordinator> CSwipeableTabController::coordinator() const {
    return m_coordinator;
}

SP<CSwipeInteractor> CSwipeableTabController::interactor() const {
    return m_interactor;
}

CBarVisibilityController& CSwipeableTabController::barController() const {
    return *m_bar;
}

SP<CSwipeTransition> CSwipeableTabController::defaultSwipeTransition() const {
    return m_swipeTransition;
}

SP<CSwipeTransition> CSwipeableTabController::defaultTapTransition() const {
    return m_tapTransition;
}
