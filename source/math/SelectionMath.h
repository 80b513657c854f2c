#pragma once

// ============================================================================
// SelectionMath - Helpers for polygonal selections
// ============================================================================

#include <QPointF>
#include <QRectF>
#include <QVector>

namespace SelectionMath {

/// Minimum amount of points a selection polygon needs to enclose an area.
constexpr int MIN_SELECTION_POINTS = 3;

/**
 * @brief Whether the selection forms a closed polygon.
 *
 * A selection is closed when it has at least three points and its last point
 * coincides with its first (the lasso returned to where it started). Polygons
 * with fewer points never enclose an area.
 */
bool isSelectionClosed(const QVector<QPointF>& selection);

/**
 * @brief Whether the selection can be used to clip drawing operations.
 */
inline bool isUsableSelection(const QVector<QPointF>& selection)
{
    return selection.size() >= MIN_SELECTION_POINTS;
}

/**
 * @brief Axis aligned bounding box of the selection, empty for no selection.
 */
QRectF selectionBounds(const QVector<QPointF>& selection);

/**
 * @brief Whether the selection describes an axis aligned rectangle.
 */
bool isSelectionRectangular(const QVector<QPointF>& selection);

/**
 * @brief Convenience to create a closed rectangular selection.
 */
QVector<QPointF> rectangleSelection(const QRectF& rect);

} // namespace SelectionMath
