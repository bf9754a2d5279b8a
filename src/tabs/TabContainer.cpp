#include "TabContainer.hpp"
#include "TabPage.hpp"
#include "TabBar.hpp"
#include "TransitionContext.hpp"
#include "PercentDrivenTransition.hpp"
#include "transitions/ITabTransition.hpp"

#include <algorithm>
#include <format>

CTabContainer::CTabContainer(const CBox& box, double barHeight) : m_box(box) {
    m_bar = CTabBar::create(CBox{box.x, box.y + box.h - barHeight, box.w, barHeight});
}

std::expected<void, std::string> CTabContainer::setPages(const std::vector<PHLPAGE>& pages, size_t selected) {
    if (pages.empty())
        return std::unexpected("a tab container needs at least one page");

    if (selected >= pages.size())
        return std::unexpected(std::format("selected index {} out of range for {} pages", selected, pages.size()));

    if (std::ranges::any_of(pages, [](const auto& p) { return !p; }))
        return std::unexpected("null page");

    if (m_activeTransition)
        return std::unexpected("can't replace pages while a transition is running");

    m_pages         = pages;
    m_selectedIndex = selected;

    const double BARINSET = m_bar->m_frame.intersection(m_box).empty() ? 0.0 : m_bar->height();

    for (size_t i = 0; i < m_pages.size(); ++i) {
        m_pages[i]->resetPresentation();
        m_pages[i]->setVisible(i == m_selectedIndex);
        m_pages[i]->m_insets.setType(Tabs::INSET_DYNAMIC_TYPE_TAB_BAR, {}, {0, BARINSET});
    }

    Log::logger->log(Log::DEBUG, "CTabContainer: {} pages, selected {}", m_pages.size(), m_selectedIndex);

    m_events.selectionChanged.emit();

    return {};
}

const std::vector<PHLPAGE>& CTabContainer::pages() const {
    return m_pages;
}

size_t CTabContainer::selectedIndex() const {
    return m_selectedIndex;
}

PHLPAGE CTabContainer::selectedPage() const {
    if (m_selectedIndex >= m_pages.size())
        return nullptr;

    return m_pages[m_selectedIndex];
}

std::optional<size_t> CTabContainer::indexOf(PHLPAGE page) const {
    if (!page)
        return std::nullopt;

    for (size_t i = 0; i < m_pages.size(); ++i) {
        if (m_pages[i] == page)
            return i;
    }

    return std::nullopt;
}

std::expected<void, std::string> CTabContainer::setSelectedIndex(size_t idx) {
    if (idx >= m_pages.size())
        return std::unexpected(std::format("index {} out of range for {} pages", idx, m_pages.size()));

    if (m_activeTransition) {
        Log::logger->log(Log::DEBUG, "CTabContainer: refusing selection of {} while {} -> {} is running", idx, m_activeTransition->m_fromIndex, m_activeTransition->m_toIndex);
        return std::unexpected("a transition is already running");
    }

    if (idx == m_selectedIndex)
        return {};

    const auto FROMIDX = m_selectedIndex;
    m_selectedIndex    = idx;

    m_events.selectionChanged.emit();

    beginTransition(FROMIDX, idx);

    return {};
}

std::expected<void, std::string> CTabContainer::userSelect(size_t idx) {
    if (idx >= m_pages.size())
        return std::unexpected(std::format("index {} out of range for {} pages", idx, m_pages.size()));

    if (const auto DELEGATE = m_delegate.lock(); DELEGATE && !DELEGATE->shouldSelect(m_pages[idx]))
        return std::unexpected("selection refused by the delegate");

    if (idx != m_selectedIndex) {
        if (auto RES = setSelectedIndex(idx); !RES)
            return RES;
    }

    notifyDidSelect();

    return {};
}

void CTabContainer::notifyDidSelect() {
    const auto PPAGE = selectedPage();

    if (const auto DELEGATE = m_delegate.lock())
        DELEGATE->didSelect(PPAGE);

    m_events.selected.emit(PPAGE);
}

void CTabContainer::beginTransition(size_t fromIdx, size_t toIdx) {
    const auto FROM     = m_pages[fromIdx];
    const auto TO       = m_pages[toIdx];
    const auto DELEGATE = m_delegate.lock();

    SP<ITabTransition> animator = DELEGATE ? DELEGATE->animationControllerFor(FROM, TO) : nullptr;
    if (!animator) {
        switchInstantly(fromIdx, toIdx);
        return;
    }

    SP<CPercentDrivenTransition> driver = DELEGATE->interactionControllerFor(animator);

    const auto                   CTX = CTransitionContext::create(FROM, TO, fromIdx, toIdx, m_box, !!driver);

    m_activeTransition = CTX;
    m_activeAnimator   = animator;

    // dies with the context
    CTX->m_events.completed.listenStatic([this, fromIdx, toIdx](bool cancelled) { onTransitionCompleted(fromIdx, toIdx, cancelled); });

    if (driver)
        driver->startInteractiveTransition(CTX, animator);
    else
        animator->animateTransition(CTX);
}

void CTabContainer::switchInstantly(size_t fromIdx, size_t toIdx) {
    Log::logger->log(Log::DEBUG, "CTabContainer: instant switch {} -> {}", fromIdx, toIdx);

    m_pages[fromIdx]->resetPresentation();
    m_pages[fromIdx]->setVisible(false);
    m_pages[toIdx]->resetPresentation();
    m_pages[toIdx]->setVisible(true);

    m_events.transitionEnded.emit(false);
}

void CTabContainer::onTransitionCompleted(size_t fromIdx, size_t toIdx, bool cancelled) {
    m_activeTransition.reset();
    m_activeAnimator.reset();

    Log::logger->log(Log::DEBUG, "CTabContainer: transition {} -> {} {}", fromIdx, toIdx, cancelled ? "cancelled" : "completed");

    if (cancelled && fromIdx < m_pages.size()) {
        m_selectedIndex = fromIdx;
        m_events.selectionChanged.emit();
    }

    m_events.transitionEnded.emit(cancelled);
}

CBox CTabContainer::containerBox() const {
    return m_box;
}

PHLBAR CTabContainer::tabBar() const {
    return m_bar;
}

SP<CTransitionContext> CTabContainer::activeTransition() const {
    return m_activeTransition;
}

void CTabContainer::setDelegate(WP<ITabContainerDelegate> delegate) {
    m_delegate = delegate;
}
