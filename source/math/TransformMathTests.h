#pragma once

// ============================================================================
// TransformMathTests - Geometry, selection and image size helpers
// ============================================================================
// Run with: brushwork --test-math
// ============================================================================

#include <QObject>
#include <QTest>

#include "TransformMath.h"
#include "ImageMath.h"
#include "SelectionMath.h"
#include "UnitMath.h"
#include "../core/Layer.h"

class TransformMathTests : public QObject {
    Q_OBJECT

private:
    static bool near(const QPointF& a, const QPointF& b, qreal tolerance = 1e-6) {
        return qAbs(a.x() - b.x()) < tolerance && qAbs(a.y() - b.y()) < tolerance;
    }

private slots:
    void testRotatePointInverse() {
        const QVector<QPointF> points = { {0, 0}, {10, 20}, {-35.5, 12.25}, {1000, -400} };
        const QVector<QPointF> pivots = { {0, 0}, {50, 50}, {-12, 7.5} };
        const QVector<qreal> angles = { 0.0, 0.3, M_PI / 2, M_PI, -2.1, 7.0 };

        for (const QPointF& p : points) {
            for (const QPointF& c : pivots) {
                for (qreal a : angles) {
                    const QPointF local = TransformMath::translatePointerRotation(p.x(), p.y(), c.x(), c.y(), a);
                    QVERIFY(near(TransformMath::rotatePoint(local, c, a), p));
                }
            }
        }
    }

    void testRotatePointQuarterTurn() {
        // clockwise in y-down space, like QTransform::rotate()
        const QPointF rotated = TransformMath::rotatePoint(QPointF(10, 0), QPointF(0, 0), M_PI / 2);
        QVERIFY(near(rotated, QPointF(0, 10)));

        QTransform transform;
        transform.rotateRadians(M_PI / 2);
        QVERIFY(near(transform.map(QPointF(10, 0)), rotated));
    }

    void testLayerSpaceRoundTrip() {
        Layer layer("test", LayerType::Graphic, 120, 80);
        layer.left = 15;
        layer.top = -20;

        const QVector<QPointF> points = { {0, 0}, {60, 40}, {133.3, 12.7}, {-50, 250} };

        for (qreal rotation : { 0.0, 30.0, 90.0, 217.5 }) {
            for (qreal scale : { 1.0, 0.5, 2.25 }) {
                for (int mirror = 0; mirror < 4; ++mirror) {
                    layer.effects.rotation = rotation;
                    layer.effects.scale = scale;
                    layer.effects.mirrorX = (mirror & 1) != 0;
                    layer.effects.mirrorY = (mirror & 2) != 0;

                    const QTransform forward = TransformMath::layerTransform(layer);
                    for (const QPointF& p : points) {
                        const QPointF local = TransformMath::toLayerSpace(p, layer);
                        QVERIFY(near(TransformMath::fromLayerSpace(local, layer), p));
                        QVERIFY(near(forward.map(local), p));
                    }
                }
            }
        }
    }

    void testToLayerSpaceRotated() {
        Layer layer("test", LayerType::Graphic, 100, 100);
        layer.effects.rotation = 90;

        // document (80, 20) shows layer pixel (20, 20) after a clockwise quarter turn
        QVERIFY(near(TransformMath::toLayerSpace(QPointF(80, 20), layer), QPointF(20, 20)));
    }

    void testMirroredContextSpace() {
        Layer layer("test", LayerType::Graphic, 100, 50);
        layer.effects.mirrorX = true;

        const QPointF document(30, 10);
        const QPointF context = TransformMath::toMirroredContextSpace(document, layer);

        QTransform flip;
        flip.scale(-1, 1);
        QVERIFY(near(flip.map(context), TransformMath::toLayerSpace(document, layer)));
    }

    void testRotateRectangle() {
        const QRectF rotated = TransformMath::rotateRectangle(QRectF(0, 0, 100, 50), M_PI / 2);
        QVERIFY(qAbs(rotated.left() - 25) < 1e-6);
        QVERIFY(qAbs(rotated.top() + 25) < 1e-6);
        QVERIFY(qAbs(rotated.width() - 50) < 1e-6);
        QVERIFY(qAbs(rotated.height() - 100) < 1e-6);

        const QRectF unrotated(5, 5, 10, 10);
        QCOMPARE(TransformMath::rotateRectangle(unrotated, 0.0), unrotated);
    }

    void testScaleRectangle() {
        const QRectF scaled = TransformMath::scaleRectangle(QRectF(0, 0, 100, 100), 2.0);
        QVERIFY(TransformMath::areEqual(scaled, QRectF(-50, -50, 200, 200)));
    }

    void testDegenerateRectangles() {
        const QRectF noWidth(10, 10, 0, 20);
        const QRectF noHeight(10, 10, 20, 0);
        QCOMPARE(TransformMath::rotateRectangle(noWidth, 1.0), noWidth);
        QCOMPARE(TransformMath::rotateRectangle(noHeight, 1.0), noHeight);
        QCOMPARE(TransformMath::scaleRectangle(noWidth, 3.0), noWidth);
        QCOMPARE(TransformMath::scaleRectangle(noHeight, 3.0), noHeight);
    }

    void testZeroScaleLayerIsInvertible() {
        Layer layer("test", LayerType::Graphic, 40, 40);
        layer.effects.scale = 0.0;

        const QPointF p(12, 34);
        QVERIFY(near(TransformMath::fromLayerSpace(TransformMath::toLayerSpace(p, layer), layer), p));
    }

    void testTransformedBounds() {
        Layer layer("test", LayerType::Graphic, 100, 50);
        layer.left = 10;
        layer.top = 10;
        QCOMPARE(TransformMath::transformedBounds(layer), layer.bounds());

        layer.effects.rotation = 90;
        const QRectF bounds = TransformMath::transformedBounds(layer);
        QVERIFY(qAbs(bounds.width() - 50) < 1e-6);
        QVERIFY(qAbs(bounds.height() - 100) < 1e-6);
        QVERIFY(near(bounds.center(), layer.bounds().center()));
    }

    void testConstrainKeepsBudgetAndRatio() {
        const qint64 budget = 1000000;

        const QSize landscape = ImageMath::constrain(4000, 3000, budget);
        QVERIFY(qint64(landscape.width()) * landscape.height() <= budget);
        QVERIFY(qAbs(qreal(landscape.width()) / landscape.height() - 4.0 / 3.0) < 0.01);

        const QSize portrait = ImageMath::constrain(1000, 5000, budget);
        QVERIFY(qint64(portrait.width()) * portrait.height() <= budget);
        QVERIFY(qAbs(qreal(portrait.width()) / portrait.height() - 0.2) < 0.01);

        // within budget: unchanged
        QCOMPARE(ImageMath::constrain(800, 600, budget), QSize(800, 600));

        // degenerate: unchanged
        QCOMPARE(ImageMath::constrain(0, 600, budget), QSize(0, 600));
    }

    void testScaleToRatio() {
        const QSizeF size = ImageMath::scaleToRatio(200, 100, 100, 100);
        // covers the destination fully
        QVERIFY(size.width() >= 100 && size.height() >= 100);
        QVERIFY(qAbs(size.width() / size.height() - 2.0) < 1e-6);

        // square images keep the destination width on both axes
        QCOMPARE(ImageMath::scaleToRatio(100, 100, 80, 50), QSizeF(80, 80));
    }

    void testSelectionMath() {
        const QVector<QPointF> rect = SelectionMath::rectangleSelection(QRectF(10, 20, 30, 40));
        QVERIFY(SelectionMath::isSelectionClosed(rect));
        QVERIFY(SelectionMath::isSelectionRectangular(rect));
        QCOMPARE(SelectionMath::selectionBounds(rect), QRectF(10, 20, 30, 40));

        const QVector<QPointF> open = { {0, 0}, {10, 0}, {10, 10} };
        QVERIFY(!SelectionMath::isSelectionClosed(open));
        QVERIFY(SelectionMath::isUsableSelection(open));

        const QVector<QPointF> line = { {0, 0}, {10, 10} };
        QVERIFY(!SelectionMath::isUsableSelection(line));
        QVERIFY(SelectionMath::selectionBounds(QVector<QPointF>()).isEmpty());
    }

    void testUnitMath() {
        QVERIFY(qAbs(UnitMath::degreesToRadians(180) - M_PI) < 1e-9);
        QVERIFY(qAbs(UnitMath::radiansToDegrees(M_PI / 2) - 90) < 1e-9);
        QCOMPARE(UnitMath::fastRound(2.5), 3);
        QVERIFY(qAbs(UnitMath::pixelsToInch(144, 72) - 2.0) < 1e-9);
        QVERIFY(qAbs(UnitMath::cmToPixels(2.54, 300) - 300) < 1e-9);
    }
};
