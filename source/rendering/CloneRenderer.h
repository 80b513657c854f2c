#pragma once

// ============================================================================
// CloneRenderer - Clone stamp primitive
// ============================================================================

#include "BrushRenderer.h"

#include <QImage>
#include <QTransform>
#include <QVector>

class QPainter;

namespace CloneRenderer {

/**
 * @brief Paint pixels copied from a source raster along a brush path.
 * @param painter Destination painter, in destination raster coordinates.
 * @param brush Provides the radius.
 * @param sourcePixels Raster the pixels are read from. Pass a copy when the
 *        source is the destination itself.
 * @param sourceToDestination Maps source raster pixels onto destination raster pixels
 *        (includes the clone offset between source anchor and destination anchor).
 * @param pointers Path in destination raster coordinates.
 */
void renderClonedStroke(QPainter& painter, const Brush& brush, const QImage& sourcePixels,
                        const QTransform& sourceToDestination, const QVector<QPointF>& pointers,
                        bool antiAlias = true);

} // namespace CloneRenderer
