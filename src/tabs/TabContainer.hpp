#pragma once

#include "ITabContainer.hpp"

// Reference host: owns the ordered pages, the selected slot and the tab bar, and runs
// page switches through whatever its delegate hands out.
class CTabContainer : public ITabContainer {
  public:
    CTabContainer(const CBox& box, double barHeight);
    virtual ~CTabContainer() = default;

    std::expected<void, std::string>         setPages(const std::vector<PHLPAGE>& pages, size_t selected = 0);

    virtual const std::vector<PHLPAGE>&      pages() const;
    virtual size_t                           selectedIndex() const;
    virtual PHLPAGE                          selectedPage() const;
    virtual std::optional<size_t>            indexOf(PHLPAGE page) const;

    virtual std::expected<void, std::string> setSelectedIndex(size_t idx);
    virtual std::expected<void, std::string> userSelect(size_t idx);
    virtual void                             notifyDidSelect();

    virtual CBox                             containerBox() const;
    virtual PHLBAR                           tabBar() const;
    virtual SP<CTransitionContext>           activeTransition() const;
    virtual void                             setDelegate(WP<ITabContainerDelegate> delegate);

  private:
    void                          beginTransition(size_t fromIdx, size_t toIdx);
    void                          switchInstantly(size_t fromIdx, size_t toIdx);
    void                          onTransitionCompleted(size_t fromIdx, size_t toIdx, bool cancelled);

    std::vector<PHLPAGE>          m_pages;
    size_t                        m_selectedIndex = 0;
    CBox                          m_box;
    PHLBAR                        m_bar;

    WP<ITabContainerDelegate>     m_delegate;

    SP<CTransitionContext>        m_activeTransition;
    SP<ITabTransition>            m_activeAnimator;
};
