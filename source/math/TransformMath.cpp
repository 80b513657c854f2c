#include "TransformMath.h"
#include "UnitMath.h"
#include "../core/Layer.h"

#include <QtMath>
#include <array>
#include <cmath>

namespace TransformMath {

namespace {

qreal effectiveScale(const Layer& layer)
{
    // a zero scale would make the inverse transform undefined
    return qFuzzyIsNull(layer.effects.scale) ? 1.0 : layer.effects.scale;
}

} // namespace

QPointF rotatePoint(const QPointF& point, const QPointF& pivot, qreal angle)
{
    const qreal cos = qCos(angle);
    const qreal sin = qSin(angle);
    const qreal dx = point.x() - pivot.x();
    const qreal dy = point.y() - pivot.y();
    return QPointF(dx * cos - dy * sin + pivot.x(),
                   dx * sin + dy * cos + pivot.y());
}

QPointF translatePointerRotation(qreal x, qreal y, qreal pivotX, qreal pivotY, qreal angle)
{
    return rotatePoint(QPointF(x, y), QPointF(pivotX, pivotY), -angle);
}

QRectF rotateRectangle(const QRectF& rect, qreal angle)
{
    if (qFuzzyIsNull(rect.width()) || qFuzzyIsNull(rect.height()) ||
        qFuzzyIsNull(std::fmod(angle, 2 * M_PI))) {
        return rect;
    }
    const QPointF center = rect.center();
    const std::array<QPointF, 4> corners = {
        rect.topLeft(), rect.topRight(), rect.bottomRight(), rect.bottomLeft()
    };
    qreal minX = 0, minY = 0, maxX = 0, maxY = 0;
    for (size_t i = 0; i < corners.size(); ++i) {
        const QPointF p = rotatePoint(corners[i], center, angle);
        if (i == 0) {
            minX = maxX = p.x();
            minY = maxY = p.y();
            continue;
        }
        minX = qMin(minX, p.x());
        maxX = qMax(maxX, p.x());
        minY = qMin(minY, p.y());
        maxY = qMax(maxY, p.y());
    }
    return QRectF(minX, minY, maxX - minX, maxY - minY);
}

QRectF scaleRectangle(const QRectF& rect, qreal scale)
{
    if (qFuzzyIsNull(rect.width()) || qFuzzyIsNull(rect.height()) || qFuzzyCompare(scale, 1.0)) {
        return rect;
    }
    const qreal width  = rect.width() * scale;
    const qreal height = rect.height() * scale;
    return QRectF(rect.left() - (width - rect.width()) / 2.0,
                  rect.top() - (height - rect.height()) / 2.0,
                  width, height);
}

bool areEqual(const QRectF& a, const QRectF& b)
{
    return qAbs(a.left() - b.left()) < EPSILON && qAbs(a.top() - b.top()) < EPSILON &&
           qAbs(a.width() - b.width()) < EPSILON && qAbs(a.height() - b.height()) < EPSILON;
}

qreal layerRotation(const Layer& layer)
{
    const qreal angle = UnitMath::degreesToRadians(layer.effects.rotation);
    return layer.effects.mirrorY ? -angle : angle;
}

QTransform layerTransform(const Layer& layer)
{
    const qreal cx = layer.width / 2.0;
    const qreal cy = layer.height / 2.0;
    const qreal scale = effectiveScale(layer);

    QTransform transform;
    transform.translate(layer.left + cx, layer.top + cy);
    transform.rotateRadians(layerRotation(layer));
    transform.scale(layer.effects.mirrorX ? -scale : scale,
                    layer.effects.mirrorY ? -scale : scale);
    transform.translate(-cx, -cy);
    return transform;
}

QPointF toLayerSpace(const QPointF& documentPoint, const Layer& layer)
{
    const qreal cx = layer.width / 2.0;
    const qreal cy = layer.height / 2.0;
    const qreal scale = effectiveScale(layer);

    // undo rotation around the layer center
    QPointF p = translatePointerRotation(documentPoint.x() - layer.left,
                                         documentPoint.y() - layer.top,
                                         cx, cy, layerRotation(layer));
    // undo scale around the layer center
    qreal x = (p.x() - cx) / scale;
    qreal y = (p.y() - cy) / scale;

    // mirroring negates relative to the half width / height
    if (layer.effects.mirrorX) {
        x = -x;
    }
    if (layer.effects.mirrorY) {
        y = -y;
    }
    return QPointF(x + cx, y + cy);
}

QPointF fromLayerSpace(const QPointF& layerPoint, const Layer& layer)
{
    const qreal cx = layer.width / 2.0;
    const qreal cy = layer.height / 2.0;
    const qreal scale = effectiveScale(layer);

    qreal x = layerPoint.x() - cx;
    qreal y = layerPoint.y() - cy;
    if (layer.effects.mirrorX) {
        x = -x;
    }
    if (layer.effects.mirrorY) {
        y = -y;
    }
    const QPointF p = rotatePoint(QPointF(x * scale + cx, y * scale + cy),
                                  QPointF(cx, cy), layerRotation(layer));
    return QPointF(p.x() + layer.left, p.y() + layer.top);
}

QPointF toMirroredContextSpace(const QPointF& documentPoint, const Layer& layer)
{
    QPointF p = toLayerSpace(documentPoint, layer);
    if (layer.effects.mirrorX) {
        p.setX(-p.x());
    }
    if (layer.effects.mirrorY) {
        p.setY(-p.y());
    }
    return p;
}

QVector<QPointF> toMirroredContextSpace(const QVector<QPointF>& documentPoints, const Layer& layer)
{
    QVector<QPointF> result;
    result.reserve(documentPoints.size());
    for (const QPointF& point : documentPoints) {
        result.append(toMirroredContextSpace(point, layer));
    }
    return result;
}

QVector<QPointF> toLayerSpace(const QVector<QPointF>& documentPoints, const Layer& layer)
{
    QVector<QPointF> result;
    result.reserve(documentPoints.size());
    for (const QPointF& point : documentPoints) {
        result.append(toLayerSpace(point, layer));
    }
    return result;
}

QRectF transformedBounds(const Layer& layer)
{
    return rotateRectangle(scaleRectangle(layer.bounds(), layer.effects.scale),
                           UnitMath::degreesToRadians(layer.effects.rotation));
}

} // namespace TransformMath
