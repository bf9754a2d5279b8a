#pragma once

#include "../helpers/math/Math.hpp"
#include <array>
#include <cstdint>

namespace Tabs {
    enum eInsetDynamicType : uint8_t {
        INSET_DYNAMIC_TYPE_TAB_BAR = 0,
        INSET_DYNAMIC_TYPE_HOST,

        INSET_DYNAMIC_TYPE_END,
    };

    // Insets of a page's content area: a fixed base plus one contribution per dynamic source.
    class CContentInsets {
      public:
        CContentInsets() = default;
        CContentInsets(double top, double right, double bottom, double left);
        ~CContentInsets() = default;

        CBox   apply(const CBox& other) const;

        void   resetType(eInsetDynamicType);
        void   addType(eInsetDynamicType, const Vector2D& topLeft, const Vector2D& bottomRight);
        void   setType(eInsetDynamicType, const Vector2D& topLeft, const Vector2D& bottomRight);
        bool   hasType(eInsetDynamicType) const;

        double left() const;
        double right() const;
        double top() const;
        double bottom() const;

        bool   operator==(const CContentInsets& other) const;

      private:
        void     calculate();

        Vector2D m_topLeft, m_bottomRight;
        Vector2D m_baseTopLeft, m_baseBottomRight;

        struct SDynamicData {
            Vector2D topLeft, bottomRight;
        };

        std::array<SDynamicData, INSET_DYNAMIC_TYPE_END> m_dynamic;
    };
};
