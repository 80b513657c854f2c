#pragma once

// ============================================================================
// GuideSnapping - Align a dragged sprite to the nearest guides
// ============================================================================

#include <QRectF>
#include <QVector>

class LayerSprite;

namespace GuideSnapping {

/**
 * @brief Offset that moves bounds onto the closest guide on each axis.
 * @param bounds Bounds to snap (document coordinates).
 * @param guides Zero-height (horizontal) and zero-width (vertical) guide rectangles.
 * @param margin Maximum distance an edge or center may be moved.
 * @return The offset to apply, (0, 0) when no guide is within the margin.
 *
 * Per axis the candidates are the two edges and the center of the bounds.
 */
QPointF snapOffset(const QRectF& bounds, const QVector<QRectF>& guides, qreal margin);

/**
 * @brief Snap the sprite's actual (transformed) bounds to the guides.
 * @return True if the sprite was moved (through LayerSprite::setBounds, so
 *         the move is part of the drag's history entry).
 */
bool snapSpriteToGuide(LayerSprite& sprite, const QVector<QRectF>& guides, qreal margin);

} // namespace GuideSnapping
