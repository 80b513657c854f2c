#include "SelectionMath.h"

#include <QtMath>

namespace SelectionMath {

namespace {

constexpr qreal CLOSE_DISTANCE = 0.5;

bool samePoint(const QPointF& a, const QPointF& b)
{
    return qAbs(a.x() - b.x()) <= CLOSE_DISTANCE && qAbs(a.y() - b.y()) <= CLOSE_DISTANCE;
}

} // namespace

bool isSelectionClosed(const QVector<QPointF>& selection)
{
    if (selection.size() < MIN_SELECTION_POINTS) {
        return false;
    }
    return samePoint(selection.first(), selection.last());
}

QRectF selectionBounds(const QVector<QPointF>& selection)
{
    if (selection.isEmpty()) {
        return QRectF();
    }
    qreal minX = selection[0].x(), maxX = minX;
    qreal minY = selection[0].y(), maxY = minY;
    for (const QPointF& pt : selection) {
        minX = qMin(minX, pt.x());
        maxX = qMax(maxX, pt.x());
        minY = qMin(minY, pt.y());
        maxY = qMax(maxY, pt.y());
    }
    return QRectF(minX, minY, maxX - minX, maxY - minY);
}

bool isSelectionRectangular(const QVector<QPointF>& selection)
{
    if (!isSelectionClosed(selection)) {
        return false;
    }
    // a rectangle drawn as a closed lasso has its four corners plus the closing point
    if (selection.size() != 5) {
        return false;
    }
    const QRectF bounds = selectionBounds(selection);
    for (int i = 0; i < 4; ++i) {
        const QPointF& pt = selection[i];
        const bool onVertical   = qFuzzyCompare(pt.x() + 1, bounds.left() + 1) || qFuzzyCompare(pt.x() + 1, bounds.right() + 1);
        const bool onHorizontal = qFuzzyCompare(pt.y() + 1, bounds.top() + 1) || qFuzzyCompare(pt.y() + 1, bounds.bottom() + 1);
        if (!onVertical || !onHorizontal) {
            return false;
        }
    }
    return true;
}

QVector<QPointF> rectangleSelection(const QRectF& rect)
{
    return {
        rect.topLeft(), rect.topRight(), rect.bottomRight(), rect.bottomLeft(), rect.topLeft()
    };
}

} // namespace SelectionMath
