#include "GuideSnapping.h"
#include "../viewport/LayerSprite.h"

#include <QtMath>

namespace GuideSnapping {

namespace {

// Smallest signed distance from any candidate to the guide position,
// accepted only when within margin.
bool closestDelta(qreal guide, const qreal (&candidates)[3], qreal margin, qreal& best)
{
    bool found = false;
    for (qreal candidate : candidates) {
        const qreal delta = guide - candidate;
        if (qAbs(delta) <= margin && (!found || qAbs(delta) < qAbs(best))) {
            best = delta;
            found = true;
        }
    }
    return found;
}

} // namespace

QPointF snapOffset(const QRectF& bounds, const QVector<QRectF>& guides, qreal margin)
{
    const qreal xCandidates[3] = { bounds.left(), bounds.center().x(), bounds.right() };
    const qreal yCandidates[3] = { bounds.top(), bounds.center().y(), bounds.bottom() };

    bool snapX = false;
    bool snapY = false;
    qreal dx = 0.0;
    qreal dy = 0.0;

    for (const QRectF& guide : guides) {
        qreal delta = 0.0;
        if (qFuzzyIsNull(guide.height())) {
            // horizontal guide
            if (closestDelta(guide.top(), yCandidates, margin, delta) && (!snapY || qAbs(delta) < qAbs(dy))) {
                dy = delta;
                snapY = true;
            }
        } else if (qFuzzyIsNull(guide.width())) {
            // vertical guide
            if (closestDelta(guide.left(), xCandidates, margin, delta) && (!snapX || qAbs(delta) < qAbs(dx))) {
                dx = delta;
                snapX = true;
            }
        }
    }
    return QPointF(dx, dy);
}

bool snapSpriteToGuide(LayerSprite& sprite, const QVector<QRectF>& guides, qreal margin)
{
    const QPointF offset = snapOffset(sprite.actualBounds(), guides, margin);
    if (offset.isNull()) {
        return false;
    }
    const QRectF bounds = sprite.bounds();
    sprite.setBounds(bounds.left() + offset.x(), bounds.top() + offset.y());
    return true;
}

} // namespace GuideSnapping
