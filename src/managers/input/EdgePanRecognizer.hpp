#pragma once

#include <functional>
#include <optional>

#include "SwipeTypes.hpp"
#include "../../defines.hpp"

// Single-touch pan recognizer for drags that start along one edge of a box.
class CEdgePanRecognizer {
  public:
    using PanHandler = std::function<void(const SSwipeSample&)>;
    using BeginGate  = std::function<bool(const CEdgePanRecognizer&)>;

    CEdgePanRecognizer(eScreenEdge edge, PanHandler handler);

    // box is the container, in the same space as the touch positions
    bool        touchDown(const STouchEvent& e, const CBox& box);
    void        touchMotion(const STouchEvent& e);
    void        touchUp(const STouchEvent& e);
    void        touchCancel(const STouchEvent& e);

    // asked right before Began. Returning false fails the recognizer for the rest of that touch
    void        setBeginGate(BeginGate gate);
    void        setHandler(PanHandler handler);

    // disabling cancels a gesture that already began
    void        setEnabled(bool enabled);
    bool        isEnabled() const;

    bool        isTracking() const;
    bool        hasBegun() const;
    int32_t     trackedTouch() const;
    eScreenEdge edge() const;
    Vector2D    translation() const;
    Vector2D    velocity() const;

  private:
    void                   reset();
    void                   updateVelocity(const STouchEvent& e);

    eScreenEdge            m_edge;
    PanHandler             m_handler;
    BeginGate              m_beginGate;
    bool                   m_enabled = true;

    std::optional<int32_t> m_touchID;
    bool                   m_began = false;
    Vector2D               m_startPos;
    Vector2D               m_lastPos;
    uint32_t               m_lastTimeMs = 0;
    Vector2D               m_velocity;
    int                    m_velocityPoints = 0;
};
