#include "TabPage.hpp"
#include "../config/ConfigManager.hpp"
#include "../managers/animation/AnimationManager.hpp"

static uint64_t nextPageID = 1;

PHLPAGE CTabPage::create(const std::string& name) {
    PHLPAGE page = makeShared<CTabPage>(name, false);
    page->init(page);
    return page;
}

PHLPAGE CTabPage::createWrapper(const std::string& name, const std::vector<PHLPAGE>& stack) {
    PHLPAGE page = makeShared<CTabPage>(name, true);
    page->init(page);
    for (auto const& c : stack) {
        page->push(c);
    }
    return page;
}

CTabPage::CTabPage(const std::string& name, bool wrapper) : m_id(nextPageID++), m_name(name), m_wrapper(wrapper) {
    ;
}

CTabPage::~CTabPage() {
    Log::logger->log(Log::TRACE, "Destroying page {} ({})", m_id, m_name);
}

void CTabPage::init(PHLPAGE self) {
    m_self = self;

    g_pAnimationManager->createAnimation(Vector2D(0, 0), m_renderOffset, g_pConfigManager->getAnimationPropertyConfig("tabs"), self, AVARDAMAGE_ENTIRE);
    g_pAnimationManager->createAnimation(1.F, m_alpha, g_pConfigManager->getAnimationPropertyConfig("tabs"), self, AVARDAMAGE_ENTIRE);
}

PHLPAGE CTabPage::firstContent() {
    if (!m_wrapper || m_children.empty())
        return m_self.lock();

    return m_children.front()->firstContent();
}

bool CTabPage::isWrapper() const {
    return m_wrapper;
}

void CTabPage::push(PHLPAGE child) {
    if (!m_wrapper) {
        Log::logger->log(Log::WARN, "CTabPage::push: page {} is not a wrapper, ignoring {}", m_name, child ? child->m_name : "null");
        return;
    }

    if (!child || child == m_self.lock())
        return;

    m_children.emplace_back(child);
}

const std::vector<PHLPAGE>& CTabPage::children() const {
    return m_children;
}

void CTabPage::setVisible(bool visible) {
    if (m_visible == visible)
        return;

    m_visible = visible;
    damage();
}

void CTabPage::resetPresentation() {
    m_renderOffset->setValueAndWarp(Vector2D(0, 0));
    m_alpha->setValueAndWarp(1.F);
}

void CTabPage::damage() {
    m_events.damaged.emit();
}
