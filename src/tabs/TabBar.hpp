#pragma once

#include "TabTypes.hpp"
#include "../defines.hpp"
#include "../helpers/AnimatedVariable.hpp"

class CTabBar {
  public:
    static PHLBAR create(const CBox& frame);

    // use create() don't use this
    CTabBar(const CBox& frame);

    double               height() const;
    void                 damage();

    // model frame: where the bar ends up once any running animation settles
    CBox                 m_frame;
    // what is on screen right now
    PHLANIMVAR<Vector2D> m_position;

    PHLBARREF            m_self;

    struct {
        CSignalT<> damaged;
    } m_events;
};
