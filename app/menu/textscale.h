#pragma once

#include <QtGlobal>

namespace PullDown {
namespace TextScale {

// Text-scale factors above this switch Full items to the large text layout.
constexpr qreal kLargeTextScaleThreshold = 1.5;

// Minimum touch target of a Full item at a text-scale factor of 1.
constexpr qreal kMinInteractiveDimension = 44.0;

inline bool isLargeTextScale(qreal textScaleFactor)
{
    return textScaleFactor > kLargeTextScaleThreshold;
}

inline int titleLineLimit(qreal textScaleFactor)
{
    return isLargeTextScale(textScaleFactor) ? 3 : 2;
}

inline qreal minimumItemHeight(qreal textScaleFactor)
{
    return kMinInteractiveDimension * textScaleFactor;
}

}
}
