#pragma once

// ============================================================================
// LowResPreview - Reduced resolution scratch raster for live strokes
// ============================================================================
// While a stroke is in progress each frame renders only the newly recorded
// segment into this raster, at a fraction of the on-screen pixel density.
// On release the full-resolution path is replayed onto the layer and the
// preview is discarded: it never feeds a committed mutation.
// ============================================================================

#include "BrushRenderer.h"

#include <QImage>
#include <QRectF>
#include <QVector>

class QPainter;

class LowResPreview {
public:
    /// Fraction of the on-screen pixel density the preview renders at.
    static constexpr qreal LOW_RES_RATIO = 0.5;

    /**
     * @brief Create a transparent preview covering the viewport.
     * @param viewport Visible area in document coordinates.
     * @param zoom On-screen pixels per document pixel.
     */
    LowResPreview(const QRectF& viewport, qreal zoom);

    QImage& image() { return m_image; }
    const QImage& image() const { return m_image; }

    /// Document pixel -> preview pixel.
    qreal scale() const { return m_scale; }

    const QRectF& viewport() const { return m_viewport; }

    QPointF map(const QPointF& documentPoint) const;

    /**
     * @brief Remap pointers into preview space for renderBrushStroke().
     */
    BrushOverrides createOverrides(const QVector<QPointF>& pointers) const;

    /**
     * @brief Draw the preview stretched over the viewport.
     * @param painter Painter in document coordinates.
     */
    void render(QPainter& painter) const;

private:
    QRectF m_viewport;
    qreal m_scale = LOW_RES_RATIO;
    QImage m_image;
};
