#include "ContentInsets.hpp"

using namespace Tabs;

CContentInsets::CContentInsets(double top, double right, double bottom, double left) : m_baseTopLeft(left, top), m_baseBottomRight(right, bottom) {
    calculate();
}

void CContentInsets::calculate() {
    m_bottomRight = m_baseBottomRight;
    m_topLeft     = m_baseTopLeft;

    for (const auto& e : m_dynamic) {
        m_bottomRight += e.bottomRight;
        m_topLeft += e.topLeft;
    }
}

CBox CContentInsets::apply(const CBox& other) const {
    auto c = other.copy();
    c.x += m_topLeft.x;
    c.y += m_topLeft.y;
    c.w -= m_topLeft.x + m_bottomRight.x;
    c.h -= m_topLeft.y + m_bottomRight.y;
    return c;
}

bool CContentInsets::operator==(const CContentInsets& other) const {
    return other.m_bottomRight == m_bottomRight && other.m_topLeft == m_topLeft;
}

double CContentInsets::left() const {
    return m_topLeft.x;
}

double CContentInsets::right() const {
    return m_bottomRight.x;
}

double CContentInsets::top() const {
    return m_topLeft.y;
}

double CContentInsets::bottom() const {
    return m_bottomRight.y;
}

void CContentInsets::resetType(eInsetDynamicType t) {
    m_dynamic[t] = {};
    calculate();
}

void CContentInsets::addType(eInsetDynamicType t, const Vector2D& topLeft, const Vector2D& bottomRight) {
    auto& ref = m_dynamic[t];
    ref.topLeft += topLeft;
    ref.bottomRight += bottomRight;
    calculate();
}

void CContentInsets::setType(eInsetDynamicType t, const Vector2D& topLeft, const Vector2D& bottomRight) {
    m_dynamic[t] = {.topLeft = topLeft, .bottomRight = bottomRight};
    calculate();
}

bool CContentInsets::hasType(eInsetDynamicType t) const {
    return !(m_dynamic[t].topLeft == Vector2D{}) || !(m_dynamic[t].bottomRight == Vector2D{});
}
