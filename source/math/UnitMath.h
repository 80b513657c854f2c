#pragma once

// ============================================================================
// UnitMath - Angle, rounding and physical unit conversions
// ============================================================================

#include <QtMath>

namespace UnitMath {

constexpr qreal CM_PER_INCH = 2.54;
constexpr qreal MM_PER_INCH = CM_PER_INCH * 10;
constexpr qreal DEFAULT_DPI = 72.0;

inline qreal degreesToRadians(qreal degrees) { return degrees * M_PI / 180.0; }
inline qreal radiansToDegrees(qreal radians) { return radians * 180.0 / M_PI; }

/**
 * @brief Round to the nearest integer, halves away from zero for positive
 * values and truncation towards zero for negative values.
 */
inline int fastRound(qreal value)
{
    return value > 0 ? static_cast<int>(value + 0.5) : static_cast<int>(value);
}

inline qreal pixelsToInch(qreal pixels, qreal dpi = DEFAULT_DPI) { return pixels / dpi; }
inline qreal pixelsToCm(qreal pixels, qreal dpi = DEFAULT_DPI) { return pixelsToInch(pixels, dpi) * CM_PER_INCH; }
inline qreal pixelsToMm(qreal pixels, qreal dpi = DEFAULT_DPI) { return pixelsToInch(pixels, dpi) * MM_PER_INCH; }
inline qreal inchesToPixels(qreal inches, qreal dpi = DEFAULT_DPI) { return inches * dpi; }
inline qreal cmToPixels(qreal cms, qreal dpi = DEFAULT_DPI) { return inchesToPixels(cms / CM_PER_INCH, dpi); }
inline qreal mmToPixels(qreal mms, qreal dpi = DEFAULT_DPI) { return inchesToPixels(mms / MM_PER_INCH, dpi); }

/**
 * @brief Scale a value (clamped to maxValue) onto the range [0, maxCompareValue].
 */
inline qreal scale(qreal value, qreal maxValue, qreal maxCompareValue)
{
    if (qFuzzyIsNull(maxValue)) {
        return 0.0;
    }
    return qMin(maxValue, value) * (maxCompareValue / maxValue);
}

} // namespace UnitMath
