#include "EdgePanRecognizer.hpp"
#include "../../config/ConfigValue.hpp"

#include <algorithm>

constexpr int64_t VELOCITY_WINDOW_MS = 100;

CEdgePanRecognizer::CEdgePanRecognizer(eScreenEdge edge, PanHandler handler) : m_edge(edge), m_handler(std::move(handler)) {
    ;
}

bool CEdgePanRecognizer::touchDown(const STouchEvent& e, const CBox& box) {
    if (!m_enabled || m_touchID.has_value())
        return false;

    static auto  PEDGEWIDTH = CConfigValue<Hyprlang::INT>("tabs:edge_width");

    const double EDGEWIDTH = std::max<Hyprlang::INT>(*PEDGEWIDTH, 1);

    if (e.pos.y < box.y || e.pos.y > box.y + box.h)
        return false;

    const bool INBAND = m_edge == SCREEN_EDGE_LEFT ? (e.pos.x >= box.x && e.pos.x <= box.x + EDGEWIDTH) : (e.pos.x <= box.x + box.w && e.pos.x >= box.x + box.w - EDGEWIDTH);

    if (!INBAND)
        return false;

    reset();

    m_touchID    = e.touchID;
    m_startPos   = e.pos;
    m_lastPos    = e.pos;
    m_lastTimeMs = e.timeMs;

    Log::logger->log(Log::TRACE, "CEdgePanRecognizer: touch {} down on the {} edge at {:j}", e.touchID, m_edge == SCREEN_EDGE_LEFT ? "left" : "right", e.pos);

    return true;
}

void CEdgePanRecognizer::touchMotion(const STouchEvent& e) {
    if (!m_enabled || m_touchID != e.touchID)
        return;

    updateVelocity(e);

    if (!m_began && translation() == Vector2D{})
        return;

    if (!m_began && m_beginGate && !m_beginGate(*this)) {
        Log::logger->log(Log::TRACE, "CEdgePanRecognizer: touch {} failed the begin gate, dropping it", e.touchID);
        reset();
        return;
    }

    const auto PHASE = m_began ? SWIPE_PHASE_CHANGED : SWIPE_PHASE_BEGAN;
    m_began          = true;

    if (m_handler)
        m_handler(SSwipeSample{.phase = PHASE, .translation = translation(), .velocity = m_velocity});
}

void CEdgePanRecognizer::touchUp(const STouchEvent& e) {
    if (!m_enabled || m_touchID != e.touchID)
        return;

    // lifting after a rest has to report the rest, not the last motion
    updateVelocity(e);

    const bool BEGAN  = m_began;
    const auto SAMPLE = SSwipeSample{.phase = SWIPE_PHASE_ENDED, .translation = translation(), .velocity = m_velocity};

    reset();

    if (BEGAN && m_handler)
        m_handler(SAMPLE);
}

void CEdgePanRecognizer::touchCancel(const STouchEvent& e) {
    if (!m_enabled || m_touchID != e.touchID)
        return;

    const bool BEGAN  = m_began;
    const auto SAMPLE = SSwipeSample{.phase = SWIPE_PHASE_CANCELLED, .translation = translation(), .velocity = m_velocity};

    reset();

    if (BEGAN && m_handler)
        m_handler(SAMPLE);
}

void CEdgePanRecognizer::updateVelocity(const STouchEvent& e) {
    const auto DELTA = e.pos - m_lastPos;
    // timestamps can repeat within one frame, count those as 1ms apart
    const auto DTMS = std::max<int64_t>(static_cast<int64_t>(e.timeMs) - static_cast<int64_t>(m_lastTimeMs), 1);

    const auto INSTANT = DELTA * (1000.0 / DTMS);

    // a finger that rested longer than the window forgets the earlier motion
    if (m_velocityPoints == 0 || DTMS > VELOCITY_WINDOW_MS)
        m_velocity = INSTANT;
    else
        m_velocity = (m_velocity + INSTANT) / 2.0;
    m_velocityPoints++;

    m_lastPos    = e.pos;
    m_lastTimeMs = e.timeMs;
}

void CEdgePanRecognizer::reset() {
    m_touchID.reset();
    m_began          = false;
    m_velocity       = {};
    m_velocityPoints = 0;
    m_startPos       = {};
    m_lastPos        = {};
}

void CEdgePanRecognizer::setBeginGate(BeginGate gate) {
    m_beginGate = std::move(gate);
}

void CEdgePanRecognizer::setHandler(PanHandler handler) {
    m_handler = std::move(handler);
}

void CEdgePanRecognizer::setEnabled(bool enabled) {
    if (m_enabled == enabled)
        return;

    m_enabled = enabled;

    if (m_enabled)
        return;

    // a gesture that already began gets cancelled, anything earlier is dropped silently
    const bool BEGAN  = m_began;
    const auto SAMPLE = SSwipeSample{.phase = SWIPE_PHASE_CANCELLED, .translation = translation(), .velocity = m_velocity};

    reset();

    if (BEGAN) {
        Log::logger->log(Log::TRACE, "CEdgePanRecognizer: disabled mid-gesture, cancelling it");

        if (m_handler)
            m_handler(SAMPLE);
    }
}

bool CEdgePanRecognizer::isEnabled() const {
    return m_enabled;
}

bool CEdgePanRecognizer::isTracking() const {
    return m_touchID.has_value();
}

bool CEdgePanRecognizer::hasBegun() const {
    return m_began;
}

int32_t CEdgePanRecognizer::trackedTouch() const {
    return m_touchID.value_or(-1);
}

eScreenEdge CEdgePanRecognizer::edge() const {
    return m_edge;
}

Vector2D CEdgePanRecognizer::translation() const {
    if (!m_touchID.has_value())
        return {};

    return m_lastPos - m_startPos;
}

Vector2D CEdgePanRecognizer::velocity() const {
    return m_velocity;
}
