#include "CloneRenderer.h"

#include <QPainter>
#include <QPainterPath>
#include <QPainterPathStroker>

namespace CloneRenderer {

void renderClonedStroke(QPainter& painter, const Brush& brush, const QImage& sourcePixels,
                        const QTransform& sourceToDestination, const QVector<QPointF>& pointers,
                        bool antiAlias)
{
    if (pointers.isEmpty() || sourcePixels.isNull()) {
        return;
    }

    QPainterPath area;
    if (pointers.size() == 1) {
        area.addEllipse(pointers.first(), brush.radius, brush.radius);
    } else {
        QPainterPath path(pointers.first());
        for (int i = 1; i < pointers.size(); ++i) {
            path.lineTo(pointers[i]);
        }
        QPainterPathStroker stroker;
        stroker.setWidth(brush.radius * 2);
        stroker.setCapStyle(Qt::RoundCap);
        stroker.setJoinStyle(Qt::RoundJoin);
        area = stroker.createStroke(path);
        area.setFillRule(Qt::WindingFill);
    }

    painter.save();
    painter.setRenderHint(QPainter::Antialiasing, antiAlias);
    painter.setClipPath(area, painter.hasClipping() ? Qt::IntersectClip : Qt::ReplaceClip);
    painter.setTransform(sourceToDestination, true);
    painter.drawImage(QPointF(0, 0), sourcePixels);
    painter.restore();
}

} // namespace CloneRenderer
