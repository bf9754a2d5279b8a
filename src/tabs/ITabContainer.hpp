#pragma once

#include <cstddef>
#include <expected>
#include <optional>
#include <string>
#include <vector>

#include "TabTypes.hpp"
#include "../defines.hpp"

class ITabTransition;
class CPercentDrivenTransition;

// Receives the container's transition queries and selection notifications.
// Every method has a default, so implementers only override what they care about.
class ITabContainerDelegate {
  public:
    virtual ~ITabContainerDelegate() = default;

    // none means an instant, non-animated switch
    virtual SP<ITabTransition> animationControllerFor(PHLPAGE from, PHLPAGE to) {
        return nullptr;
    }

    // none means the transition runs on its own instead of being driven
    virtual SP<CPercentDrivenTransition> interactionControllerFor(SP<ITabTransition> animator) {
        return nullptr;
    }

    virtual bool shouldSelect(PHLPAGE page) {
        return true;
    }

    virtual void didSelect(PHLPAGE page) {
        ;
    }
};

class ITabContainer {
  public:
    virtual ~ITabContainer() = default;

    virtual const std::vector<PHLPAGE>&      pages() const       = 0;
    virtual size_t                           selectedIndex() const = 0;
    virtual PHLPAGE                          selectedPage() const  = 0;
    virtual std::optional<size_t>            indexOf(PHLPAGE page) const = 0;

    // programmatic selection, skips shouldSelect / didSelect
    virtual std::expected<void, std::string> setSelectedIndex(size_t idx) = 0;
    // tap path: shouldSelect, select, didSelect
    virtual std::expected<void, std::string> userSelect(size_t idx) = 0;
    // re-announces the current selection to the delegate and listeners
    virtual void                             notifyDidSelect() = 0;

    virtual CBox                             containerBox() const        = 0;
    virtual PHLBAR                           tabBar() const              = 0;
    virtual SP<CTransitionContext>           activeTransition() const    = 0;
    virtual void                             setDelegate(WP<ITabContainerDelegate> delegate) = 0;

    struct {
        CSignalT<>        selectionChanged;
        CSignalT<PHLPAGE> selected;
        // arg: cancelled
        CSignalT<bool> transitionEnded;
    } m_events;
};
