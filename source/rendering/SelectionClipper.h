#pragma once

// ============================================================================
// SelectionClipper - Constrain painting to a selection polygon
// ============================================================================

#include <QPointF>
#include <QVector>
#include <QPainterPath>

class QPainter;
struct BrushOverrides;

namespace SelectionClipper {

/**
 * @brief Build the closed path for a selection polygon.
 * @param points Polygon in document coordinates.
 * @param offsetX Subtracted from every x (e.g. the layer left).
 * @param offsetY Subtracted from every y (e.g. the layer top).
 * @param overrides When given, points are mapped into the low resolution
 *        preview space instead of being offset.
 */
QPainterPath selectionPath(const QVector<QPointF>& points, qreal offsetX, qreal offsetY,
                           const BrushOverrides* overrides = nullptr);

/**
 * @brief Clip the painter to the selection polygon.
 * @return True when a clip was applied, false when the polygon has fewer than
 *         three points (treated as "no selection", the painter is untouched).
 *
 * The clip intersects with any existing clip. Callers are expected to
 * save()/restore() around it.
 *
 * With invert set, paint lands on the complement of the polygon. Inversion is
 * done on the clip, not by switching the painter's composition mode: the path
 * gets the paint device bounds added and its fill rule switched to odd-even,
 * so the polygon interior becomes the "hole". The composition mode the caller
 * set (e.g. DestinationOut for erasing) is left untouched.
 */
bool clipPainterToSelection(QPainter& painter, const QVector<QPointF>& points,
                            qreal offsetX, qreal offsetY, bool invert,
                            const BrushOverrides* overrides = nullptr);

} // namespace SelectionClipper
