#include "BrushRenderer.h"

#include <QPainter>
#include <QPainterPath>
#include <QPen>
#include <QtMath>

Brush Brush::create(const QColor& color, const BrushOptions& options, const QVector<QPointF>& pointers)
{
    Brush brush;
    brush.color = color;
    brush.radius = options.size;
    brush.options = options;
    brush.pointers = pointers;
    return brush;
}

QVector<QPointF> slicePointers(const Brush& brush)
{
    const int start = qMax(0, brush.last - 1);
    if (start >= brush.pointers.size()) {
        return QVector<QPointF>();
    }
    return brush.pointers.mid(start);
}

void renderBrushStroke(QPainter& painter, const Brush& brush,
                       const BrushOverrides* overrides, bool antiAlias)
{
    const QVector<QPointF>& pointers = overrides ? overrides->pointers : brush.pointers;
    if (pointers.isEmpty()) {
        return;
    }
    const qreal scale  = overrides ? overrides->scale : 1.0;
    const qreal radius = qMax(0.5, brush.radius * scale);

    QColor drawColor = brush.color;
    drawColor.setAlpha(255);

    painter.save();
    painter.setRenderHint(QPainter::Antialiasing, antiAlias);

    // Single pointer: a dot
    if (pointers.size() == 1) {
        painter.setPen(Qt::NoPen);
        painter.setBrush(drawColor);
        painter.drawEllipse(pointers.first(), radius, radius);
        painter.restore();
        return;
    }

    QPainterPath path(pointers.first());
    for (int i = 1; i < pointers.size(); ++i) {
        path.lineTo(pointers[i]);
    }
    painter.setBrush(Qt::NoBrush);

    const int strokes = qMax(1, brush.options.strokes);
    if (strokes == 1) {
        painter.setPen(QPen(drawColor, radius * 2, Qt::SolidLine, Qt::RoundCap, Qt::RoundJoin));
        painter.drawPath(path);
        painter.restore();
        return;
    }

    // Bristles: thinner parallel strokes spread diagonally across the brush diameter
    const qreal spacing = (radius * 2) / strokes;
    const qreal bristleWidth = qMax(1.0, spacing / 2);
    painter.setPen(QPen(drawColor, bristleWidth, Qt::SolidLine, Qt::RoundCap, Qt::RoundJoin));
    for (int i = 0; i < strokes; ++i) {
        const qreal offset = (-radius + spacing * (i + 0.5)) * M_SQRT1_2;
        painter.drawPath(path.translated(offset, offset));
    }
    painter.restore();
}
