#pragma once

// ============================================================================
// TransformMath - Point/rectangle rotation and layer coordinate spaces
// ============================================================================
// All functions are pure. Angles are in radians and follow the Qt convention:
// positive angles rotate clockwise in the y-down document space, which is the
// same convention as QTransform::rotate().
// ============================================================================

#include <QPointF>
#include <QRectF>
#include <QSizeF>
#include <QTransform>
#include <QVector>

class Layer;

namespace TransformMath {

/// Tolerance used for geometric comparisons.
constexpr qreal EPSILON = 1e-9;

/**
 * @brief Rotate a point around a pivot (forward transform).
 */
QPointF rotatePoint(const QPointF& point, const QPointF& pivot, qreal angle);

/**
 * @brief Translate a pointer position into the coordinate space of content
 * that is rotated by the given angle around the given pivot.
 *
 * This is the inverse of rotatePoint(): rotatePoint(translatePointerRotation(p, c, a), c, a) == p.
 */
QPointF translatePointerRotation(qreal x, qreal y, qreal pivotX, qreal pivotY, qreal angle);

/**
 * @brief Rotate a rectangle around its own center.
 * @return The axis aligned rectangle containing the rotated rectangle.
 *         Rectangles with zero width or height are returned unchanged.
 */
QRectF rotateRectangle(const QRectF& rect, qreal angle);

/**
 * @brief Scale a rectangle around its own center.
 *         Rectangles with zero width or height are returned unchanged.
 */
QRectF scaleRectangle(const QRectF& rect, qreal scale);

bool areEqual(const QRectF& a, const QRectF& b);

/**
 * @brief Rotation (radians) the layer content is rendered with.
 *
 * A vertically mirrored layer rotates in the opposite direction so that
 * mirroring and rotation compose the same way for both axes.
 */
qreal layerRotation(const Layer& layer);

/**
 * @brief Forward render transform of a layer (layer pixel -> document).
 */
QTransform layerTransform(const Layer& layer);

/**
 * @brief Map a document point into the layer's pixel space (un-rotated,
 * un-scaled, un-mirrored). Inverse of fromLayerSpace().
 */
QPointF toLayerSpace(const QPointF& documentPoint, const Layer& layer);

/**
 * @brief Map a layer pixel coordinate back into document space.
 */
QPointF fromLayerSpace(const QPointF& layerPoint, const Layer& layer);

/**
 * @brief Map a document point into a drawing context whose axes have been
 * flipped with QPainter::scale(-1, 1) / (1, -1) for mirrored layers.
 *
 * Drawing at the returned coordinate through the flipped context lands on
 * the pixel returned by toLayerSpace().
 */
QPointF toMirroredContextSpace(const QPointF& documentPoint, const Layer& layer);

QVector<QPointF> toMirroredContextSpace(const QVector<QPointF>& documentPoints, const Layer& layer);

QVector<QPointF> toLayerSpace(const QVector<QPointF>& documentPoints, const Layer& layer);

/**
 * @brief The document-space bounds of a layer after its scale and rotation.
 */
QRectF transformedBounds(const Layer& layer);

} // namespace TransformMath
