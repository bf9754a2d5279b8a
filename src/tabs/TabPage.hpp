#pragma once

#include <string>
#include <vector>

#include "TabTypes.hpp"
#include "ContentInsets.hpp"
#include "../defines.hpp"
#include "../helpers/AnimatedVariable.hpp"

// A page hosted by a tab container. A wrapper page (navigation-style stack) forwards
// to its first child for anything that needs the real content.
class CTabPage {
  public:
    static PHLPAGE create(const std::string& name);
    static PHLPAGE createWrapper(const std::string& name, const std::vector<PHLPAGE>& stack);

    // use create() don't use this
    CTabPage(const std::string& name, bool wrapper);
    ~CTabPage();

    PHLPAGE                     firstContent();
    bool                        isWrapper() const;
    void                        push(PHLPAGE child);
    const std::vector<PHLPAGE>& children() const;

    void                        setVisible(bool visible);
    void                        resetPresentation();
    void                        damage();

    uint64_t                    m_id = 0;
    std::string                 m_name;
    bool                        m_visible = false;

    PHLANIMVAR<Vector2D>        m_renderOffset;
    PHLANIMVAR<float>           m_alpha;

    Tabs::CContentInsets        m_insets;

    PHLPAGEREF                  m_self;

    struct {
        CSignalT<> damaged;
    } m_events;

  private:
    void                 init(PHLPAGE self);

    bool                 m_wrapper = false;
    std::vector<PHLPAGE> m_children;
};
