#pragma once

// ============================================================================
// ImageMath - Size fitting helpers for rasters
// ============================================================================

#include <QSize>
#include <QSizeF>

namespace ImageMath {

/**
 * @brief Fit an image of the given size into a destination area while keeping
 * its aspect ratio. The result covers the destination fully, which means it can
 * exceed the destination on one axis (cropping or scrolling is up to the caller).
 */
QSizeF scaleToRatio(qreal imageWidth, qreal imageHeight, qreal destWidth, qreal destHeight);

/**
 * @brief Shrink a size so that width * height never exceeds maxPixels.
 *
 * The aspect ratio is preserved. Sizes already within budget are returned as-is.
 * Degenerate input (zero or negative dimensions) is returned unchanged.
 */
QSize constrain(int width, int height, qint64 maxPixels);

inline bool isSquare(qreal width, qreal height) { return qFuzzyCompare(width, height); }

} // namespace ImageMath
