#include "LowResPreview.h"

#include <QPainter>
#include <QtMath>

LowResPreview::LowResPreview(const QRectF& viewport, qreal zoom)
    : m_viewport(viewport)
    , m_scale(qMax(zoom, 0.01) * LOW_RES_RATIO)
{
    const int width  = qMax(1, qCeil(viewport.width() * m_scale));
    const int height = qMax(1, qCeil(viewport.height() * m_scale));
    m_image = QImage(width, height, QImage::Format_ARGB32_Premultiplied);
    m_image.fill(Qt::transparent);
}

QPointF LowResPreview::map(const QPointF& documentPoint) const
{
    return (documentPoint - m_viewport.topLeft()) * m_scale;
}

BrushOverrides LowResPreview::createOverrides(const QVector<QPointF>& pointers) const
{
    BrushOverrides overrides;
    overrides.scale = m_scale;
    overrides.origin = m_viewport.topLeft();
    overrides.pointers.reserve(pointers.size());
    for (const QPointF& pt : pointers) {
        overrides.pointers.append(map(pt));
    }
    return overrides;
}

void LowResPreview::render(QPainter& painter) const
{
    painter.save();
    painter.setRenderHint(QPainter::SmoothPixmapTransform, true);
    painter.drawImage(m_viewport, m_image);
    painter.restore();
}
