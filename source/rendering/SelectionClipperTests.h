#pragma once

// ============================================================================
// SelectionClipperTests - Painting constrained to (inverted) selections
// ============================================================================
// Run with: brushwork --test-selection
// ============================================================================

#include <QObject>
#include <QTest>
#include <QPainter>

#include "SelectionClipper.h"
#include "../math/SelectionMath.h"
#include "../core/Document.h"
#include "../core/Layer.h"
#include "../core/PaintCanvas.h"
#include "../core/Scheduler.h"
#include "../viewport/LayerSprite.h"

class SelectionClipperTests : public QObject {
    Q_OBJECT

private:
    // Selection square used throughout, in document coordinates
    static QRectF selectionRect() { return QRectF(20, 20, 40, 40); }

    static bool strictlyInside(int x, int y) {
        // one pixel margin keeps the polygon edge itself out of the check
        return x > 20 && x < 59 && y > 20 && y < 59;
    }
    static bool strictlyOutside(int x, int y) {
        return x < 19 || x > 60 || y < 19 || y > 60;
    }

    static QImage transparentImage() {
        QImage image(100, 100, Layer::RASTER_FORMAT);
        image.fill(Qt::transparent);
        return image;
    }

private slots:
    void testSelectionPathIsClosed() {
        const QVector<QPointF> points = { {10, 10}, {50, 10}, {30, 40} };
        const QPainterPath path = SelectionClipper::selectionPath(points, 10, 5);

        QCOMPARE(path.elementCount(), 4);
        QCOMPARE(QPointF(path.elementAt(0)), QPointF(0, 5));
        QCOMPARE(QPointF(path.elementAt(3)), QPointF(0, 5));
        QVERIFY(path.contains(QPointF(20, 10)));
    }

    void testClipContainment() {
        QImage image = transparentImage();
        QPainter painter(&image);
        QVERIFY(SelectionClipper::clipPainterToSelection(
            painter, SelectionMath::rectangleSelection(selectionRect()), 0, 0, false));
        painter.fillRect(image.rect(), Qt::red);
        painter.end();

        for (int y = 0; y < image.height(); ++y) {
            for (int x = 0; x < image.width(); ++x) {
                if (strictlyInside(x, y)) {
                    QCOMPARE(image.pixelColor(x, y), QColor(Qt::red));
                } else if (strictlyOutside(x, y)) {
                    QCOMPARE(qAlpha(image.pixel(x, y)), 0);
                }
            }
        }
    }

    void testInvertedClipContainment() {
        QImage image = transparentImage();
        QPainter painter(&image);
        QVERIFY(SelectionClipper::clipPainterToSelection(
            painter, SelectionMath::rectangleSelection(selectionRect()), 0, 0, true));
        painter.fillRect(image.rect(), Qt::red);
        painter.end();

        for (int y = 0; y < image.height(); ++y) {
            for (int x = 0; x < image.width(); ++x) {
                if (strictlyInside(x, y)) {
                    QCOMPARE(qAlpha(image.pixel(x, y)), 0);
                } else if (strictlyOutside(x, y)) {
                    QCOMPARE(image.pixelColor(x, y), QColor(Qt::red));
                }
            }
        }
    }

    void testInvertedClipKeepsCompositionMode() {
        QImage image = transparentImage();
        image.fill(Qt::red);
        QPainter painter(&image);
        painter.setCompositionMode(QPainter::CompositionMode_DestinationOut);
        QVERIFY(SelectionClipper::clipPainterToSelection(
            painter, SelectionMath::rectangleSelection(selectionRect()), 0, 0, true));
        QCOMPARE(painter.compositionMode(), QPainter::CompositionMode_DestinationOut);
        painter.fillRect(image.rect(), Qt::black);
        painter.end();

        // erased around the selection, kept inside it
        QCOMPARE(image.pixelColor(40, 40), QColor(Qt::red));
        QCOMPARE(qAlpha(image.pixel(5, 5)), 0);
        QCOMPARE(qAlpha(image.pixel(90, 90)), 0);
    }

    void testOffsetIsSubtracted() {
        QImage image = transparentImage();
        QPainter painter(&image);
        // selection in document space, raster placed at (10, 10)
        SelectionClipper::clipPainterToSelection(
            painter, SelectionMath::rectangleSelection(selectionRect()), 10, 10, false);
        painter.fillRect(image.rect(), Qt::red);
        painter.end();

        QCOMPARE(image.pixelColor(15, 15), QColor(Qt::red));
        QCOMPARE(qAlpha(image.pixel(55, 55)), 0);
    }

    void testTooFewPointsDoesNotClip() {
        QImage image = transparentImage();
        QPainter painter(&image);
        const QVector<QPointF> line = { {0, 0}, {50, 50} };
        QVERIFY(!SelectionClipper::clipPainterToSelection(painter, line, 0, 0, false));
        QVERIFY(!painter.hasClipping());
        painter.fillRect(image.rect(), Qt::red);
        painter.end();

        QCOMPARE(image.pixelColor(0, 0), QColor(Qt::red));
        QCOMPARE(image.pixelColor(99, 99), QColor(Qt::red));
    }

    void testFillToolRespectsSelection() {
        for (bool invert : { false, true }) {
            ManualScheduler scheduler;
            auto document = Document::createNew("selection", 100, 100);
            PaintCanvas canvas(document.get(), scheduler);
            Layer* layer = document->layer(0);
            LayerSprite* sprite = canvas.createSprite(layer->id);
            QVERIFY(sprite);

            document->setSelection(SelectionMath::rectangleSelection(selectionRect()), invert);
            canvas.setActiveColor(Qt::blue);
            sprite->handleActiveTool(ToolType::Fill, BrushOptions(), *document);
            QCOMPARE(sprite->selection().size(), 5);

            sprite->handlePress(40, 40);
            sprite->handleRelease(40, 40);

            for (int y = 0; y < 100; ++y) {
                for (int x = 0; x < 100; ++x) {
                    const bool painted = qAlpha(layer->source.pixel(x, y)) != 0;
                    if (strictlyInside(x, y)) {
                        QCOMPARE(painted, !invert);
                    } else if (strictlyOutside(x, y)) {
                        QCOMPARE(painted, invert);
                    }
                }
            }
        }
    }

    void testOpenSelectionIsIgnoredByDrawingTools() {
        ManualScheduler scheduler;
        auto document = Document::createNew("selection", 100, 100);
        PaintCanvas canvas(document.get(), scheduler);
        Layer* layer = document->layer(0);
        LayerSprite* sprite = canvas.createSprite(layer->id);

        document->setSelection({ {20, 20}, {60, 20}, {60, 60} });
        sprite->handleActiveTool(ToolType::Fill, BrushOptions(), *document);
        QVERIFY(sprite->selection().isEmpty());

        // the whole raster is filled
        sprite->handlePress(5, 5);
        QVERIFY(qAlpha(layer->source.pixel(0, 0)) != 0);
        QVERIFY(qAlpha(layer->source.pixel(99, 99)) != 0);
    }

    void testStrokeSelection() {
        ManualScheduler scheduler;
        auto document = Document::createNew("selection", 100, 100);
        PaintCanvas canvas(document.get(), scheduler);
        Layer* layer = document->layer(0);
        LayerSprite* sprite = canvas.createSprite(layer->id);

        document->setSelection(SelectionMath::rectangleSelection(selectionRect()));
        sprite->strokeSelection(Qt::green, 4);

        // the outline is painted just inside the edge
        QVERIFY(qAlpha(layer->source.pixel(40, 20)) != 0);
        QCOMPARE(qAlpha(layer->source.pixel(40, 40)), 0);
        QCOMPARE(qAlpha(layer->source.pixel(40, 10)), 0);
    }

    void testEraseSelectionContent() {
        ManualScheduler scheduler;
        auto document = Document::createNew("selection", 100, 100);
        Layer* layer = document->layer(0);
        layer->source.fill(Qt::red);

        document->setSelection(SelectionMath::rectangleSelection(selectionRect()));
        const QImage erased = document->eraseSelectionContent(*layer);
        QCOMPARE(qAlpha(erased.pixel(40, 40)), 0);
        QCOMPARE(erased.pixelColor(5, 5), QColor(Qt::red));

        // the layer itself is untouched
        QCOMPARE(layer->source.pixelColor(40, 40), QColor(Qt::red));

        document->setInvertSelection(true);
        const QImage inverted = document->eraseSelectionContent(*layer);
        QCOMPARE(inverted.pixelColor(40, 40), QColor(Qt::red));
        QCOMPARE(qAlpha(inverted.pixel(5, 5)), 0);
    }

    void testCopySelection() {
        auto document = Document::createNew("selection", 100, 100);
        Layer* layer = document->layer(0);
        layer->source.fill(Qt::red);
        layer->left = 30;

        QVERIFY(document->copySelection(*layer).isNull());

        // triangle with a 40x40 bounding box at (20, 20)
        document->setSelection({ {20, 20}, {60, 20}, {20, 60}, {20, 20} });
        const QImage copy = document->copySelection(*layer);
        QCOMPARE(copy.size(), QSize(40, 40));
        // the layer starts at x = 30
        QCOMPARE(qAlpha(copy.pixel(5, 5)), 0);
        QCOMPARE(copy.pixelColor(15, 5), QColor(Qt::red));
        // outside the triangle
        QCOMPARE(qAlpha(copy.pixel(35, 35)), 0);

        // the layer itself is untouched
        QCOMPARE(layer->source.pixelColor(5, 5), QColor(Qt::red));
    }

    void testCopySelectionMerged() {
        auto document = Document::createNew("selection", 100, 100);
        Layer* bottom = document->layer(0);
        bottom->source.fill(Qt::red);
        Layer* top = document->addLayer("Layer 2");
        top->source.fill(Qt::transparent);
        {
            QPainter painter(&top->source);
            painter.fillRect(QRect(0, 0, 40, 100), Qt::blue);
        }

        document->setSelection(SelectionMath::rectangleSelection(selectionRect()));
        const QImage merged = document->copySelection(*bottom, true);
        QCOMPARE(merged.size(), QSize(40, 40));
        QCOMPARE(merged.pixelColor(5, 5), QColor(Qt::blue));
        QCOMPARE(merged.pixelColor(30, 5), QColor(Qt::red));

        const QImage single = document->copySelection(*bottom);
        QCOMPARE(single.pixelColor(5, 5), QColor(Qt::red));

        top->visible = false;
        QCOMPARE(document->copySelection(*bottom, true).pixelColor(5, 5), QColor(Qt::red));
    }

    void testCopyInvertedSelection() {
        auto document = Document::createNew("selection", 100, 100);
        Layer* layer = document->layer(0);
        layer->source.fill(Qt::red);

        document->setSelection(SelectionMath::rectangleSelection(selectionRect()), true);
        const QImage copy = document->copySelection(*layer);
        QCOMPARE(copy.size(), QSize(100, 100));
        QCOMPARE(qAlpha(copy.pixel(40, 40)), 0);
        QCOMPARE(copy.pixelColor(5, 5), QColor(Qt::red));
        QCOMPARE(copy.pixelColor(90, 90), QColor(Qt::red));
    }
};
