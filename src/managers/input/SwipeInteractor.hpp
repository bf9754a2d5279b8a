#pragma once

#include <cstdint>
#include <unordered_map>

#include "SwipeTypes.hpp"
#include "EdgePanRecognizer.hpp"
#include "../../tabs/TabTypes.hpp"
#include "../../defines.hpp"

class CTransitionCoordinator;
class CPercentDrivenTransition;

// Turns edge pans on the selected page into a percent-driven tab switch.
//
// Idle -> Suspended (diagonal) -> Idle
// Idle -> Armed -> Tracking -> Committing | Cancelling -> Idle
class CSwipeInteractor {
  public:
    CSwipeInteractor(WP<CTransitionCoordinator> coordinator);
    ~CSwipeInteractor();

    // registers a fresh left / right recognizer pair on the page's content, replacing an old one
    void                         wireTo(PHLPAGE page);
    void                         handlePan(const SSwipeSample& sample);

    // only meaningful for recognizers of the bound pair, anything else may always recognize
    bool                         shouldRecognizeSimultaneously(const CEdgePanRecognizer& recognizer) const;

    void                         onTouchDown(const STouchEvent& e);
    void                         onTouchMotion(const STouchEvent& e);
    void                         onTouchUp(const STouchEvent& e);
    void                         onTouchCancel(const STouchEvent& e);

    void                         setEnabled(bool enabled);
    bool                         isEnabled() const;
    void                         setDiagonalSwipe(bool enabled);
    bool                         isDiagonalSwipeEnabled() const;

    bool                         interactionInProgress() const;
    // in progress, or released and still settling
    bool                         interactionActive() const;
    bool                         shouldComplete() const;
    bool                         isRightToLeft() const;
    bool                         isSuspended() const;

    SP<CPercentDrivenTransition> progressDriver() const;
    PHLPAGE                      boundPage() const;
    size_t                       registeredPairs() const;
    bool                         hasRecognizersFor(PHLPAGE page) const;
    SP<CEdgePanRecognizer>       recognizerFor(PHLPAGE page, eScreenEdge edge) const;

    struct {
        CSignalT<> gestureStarted;
        CSignalT<> gestureFinished;
        // a drag committed, the container should re-announce its selection
        CSignalT<> transitionFinished;
    } m_events;

  private:
    struct SRecognizerPair {
        PHLPAGEREF             page;
        SP<CEdgePanRecognizer> left;
        SP<CEdgePanRecognizer> right;
    };

    void                                         handlePanFrom(SP<CEdgePanRecognizer> source, const SSwipeSample& sample);
    void                                         onBegan(const SSwipeSample& sample);
    void                                         onChanged(const SSwipeSample& sample);
    void                                         onReleased(const SSwipeSample& sample);
    bool                                         shouldSuspendInteraction(const SSwipeSample& sample) const;
    const SRecognizerPair*                       pairOwning(const CEdgePanRecognizer& recognizer) const;
    void                                         pruneDeadPairs();

    WP<CTransitionCoordinator>                   m_coordinator;
    SP<CPercentDrivenTransition>                 m_driver;

    PHLPAGEREF                                   m_boundPage;
    std::unordered_map<uint64_t, SRecognizerPair> m_recognizers;
    // touch id -> page id of the pair that saw it go down
    std::unordered_map<int32_t, uint64_t>        m_touchOwners;
    // the recognizer whose Began started the current gesture
    SP<CEdgePanRecognizer>                       m_interactionSource;

    bool                                         m_enabled       = true;
    bool                                         m_diagonalSwipe = false;

    bool                                         m_inProgress     = false;
    bool                                         m_rightToLeft    = false;
    bool                                         m_shouldComplete = false;
    bool                                         m_suspended      = false;
};
