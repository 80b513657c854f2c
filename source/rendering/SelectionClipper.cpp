#include "SelectionClipper.h"
#include "BrushRenderer.h"
#include "../math/SelectionMath.h"

#include <QPainter>
#include <QPaintDevice>

namespace SelectionClipper {

QPainterPath selectionPath(const QVector<QPointF>& points, qreal offsetX, qreal offsetY,
                           const BrushOverrides* overrides)
{
    QPainterPath path;
    if (points.isEmpty()) {
        return path;
    }
    for (int i = 0; i < points.size(); ++i) {
        const QPointF pt = overrides ? overrides->map(points[i])
                                     : QPointF(points[i].x() - offsetX, points[i].y() - offsetY);
        if (i == 0) {
            path.moveTo(pt);
        } else {
            path.lineTo(pt);
        }
    }
    path.closeSubpath();
    return path;
}

bool clipPainterToSelection(QPainter& painter, const QVector<QPointF>& points,
                            qreal offsetX, qreal offsetY, bool invert,
                            const BrushOverrides* overrides)
{
    if (!SelectionMath::isUsableSelection(points)) {
        return false;
    }

    QPainterPath path = selectionPath(points, offsetX, offsetY, overrides);

    if (invert) {
        // device bounds expressed in the painter's current user space
        QRectF deviceBounds;
        if (QPaintDevice* device = painter.device()) {
            deviceBounds = QRectF(0, 0, device->width(), device->height());
        }
        const QRectF userBounds = painter.transform().inverted().mapRect(deviceBounds)
                                      .united(path.boundingRect())
                                      .adjusted(-1, -1, 1, 1);
        path.addRect(userBounds);
        path.setFillRule(Qt::OddEvenFill);
    }

    painter.setClipPath(path, painter.hasClipping() ? Qt::IntersectClip : Qt::ReplaceClip);
    return true;
}

} // namespace SelectionClipper
