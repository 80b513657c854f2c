#pragma once

// ============================================================================
// EffectCacheTests - Per frame effect recompute and the layer composite
// ============================================================================
// Run with: brushwork --test-effects
// ============================================================================

#include <QObject>
#include <QTest>

#include "EffectCache.h"
#include "EffectRenderer.h"
#include "../core/Document.h"
#include "../core/Layer.h"
#include "../core/PaintCanvas.h"
#include "../core/Scheduler.h"
#include "../viewport/LayerSprite.h"

class EffectCacheTests : public QObject {
    Q_OBJECT

private:
    // Installs a fresh renderer so renderCount starts at zero.
    static LayerEffectRenderer* installCountingRenderer(PaintCanvas& canvas) {
        auto renderer = std::make_unique<LayerEffectRenderer>(canvas.effectCache());
        LayerEffectRenderer* counter = renderer.get();
        canvas.setEffectRenderer(std::move(renderer));
        return counter;
    }

private slots:
    void testRecomputeOncePerFrame() {
        ManualScheduler scheduler;
        auto document = Document::createNew("effects", 50, 50);
        PaintCanvas canvas(document.get(), scheduler);
        LayerEffectRenderer* counter = installCountingRenderer(canvas);
        const QString id = document->layer(0)->id;

        EffectCache& cache = canvas.effectCache();
        QVERIFY(cache.requestRecompute(id));
        QVERIFY(!cache.requestRecompute(id));
        QVERIFY(!cache.requestRecompute(id));
        QVERIFY(cache.isRecomputePending(id));

        QCOMPARE(scheduler.runFrame(), 1);
        QCOMPARE(counter->renderCount(), 1);
        QVERIFY(!cache.isRecomputePending(id));
        QVERIFY(cache.isValid(id, EffectCache::Property::Bitmap));

        // still valid, the next request is a cache hit
        QVERIFY(cache.requestRecompute(id));
        scheduler.runFrame();
        QCOMPARE(counter->renderCount(), 1);
    }

    void testCancelRecompute() {
        ManualScheduler scheduler;
        auto document = Document::createNew("effects", 50, 50);
        PaintCanvas canvas(document.get(), scheduler);
        LayerEffectRenderer* counter = installCountingRenderer(canvas);
        const QString id = document->layer(0)->id;

        EffectCache& cache = canvas.effectCache();
        cache.requestRecompute(id);
        cache.cancelRecompute(id);
        QVERIFY(!cache.isRecomputePending(id));
        QCOMPARE(scheduler.runFrame(), 0);

        scheduler.runFrame();
        QCOMPARE(counter->renderCount(), 0);

        // a cancelled request can be made again
        QVERIFY(cache.requestRecompute(id));
    }

    void testFilterInvalidationInvalidatesBitmap() {
        ManualScheduler scheduler;
        EffectCache cache(scheduler);
        QImage bitmap = Layer::createRaster(4, 4);

        cache.store("layer", bitmap, LayerFilters());
        QVERIFY(cache.isValid("layer", EffectCache::Property::Filters));
        QVERIFY(cache.isValid("layer", EffectCache::Property::Bitmap));

        cache.invalidate("layer", EffectCache::Property::Bitmap);
        QVERIFY(cache.isValid("layer", EffectCache::Property::Filters));
        QVERIFY(!cache.isValid("layer", EffectCache::Property::Bitmap));

        cache.store("layer", bitmap, LayerFilters());
        cache.invalidate("layer", EffectCache::Property::Filters);
        QVERIFY(!cache.isValid("layer", EffectCache::Property::Filters));
        QVERIFY(!cache.isValid("layer", EffectCache::Property::Bitmap));

        cache.flushLayer("layer");
        QVERIFY(!cache.contains("layer"));
        QVERIFY(cache.bitmap("layer").isNull());
    }

    void testMissingLayerIsSkipped() {
        ManualScheduler scheduler;
        EffectCache cache(scheduler);
        cache.setLayerResolver([](const QString&) -> Layer* { return nullptr; });

        QVERIFY(cache.requestRecompute("gone"));
        scheduler.runFrame();
        QVERIFY(!cache.isRecomputePending("gone"));
        QVERIFY(!cache.isValid("gone", EffectCache::Property::Bitmap));
    }

    void testCompositeFilters() {
        Layer layer("filters", LayerType::Graphic, 2, 1);
        layer.ensureSource();
        layer.source.setPixel(0, 0, qRgba(200, 100, 50, 255));
        layer.source.setPixel(1, 0, qRgba(10, 20, 30, 255));

        // disabled filters leave the pixels alone
        layer.filters.invert = true;
        QCOMPARE(LayerEffectRenderer::composite(layer).pixel(0, 0), qRgba(200, 100, 50, 255));

        layer.filters.enabled = true;
        QImage inverted = LayerEffectRenderer::composite(layer);
        QCOMPARE(inverted.pixel(0, 0), qRgba(55, 155, 205, 255));
        QCOMPARE(inverted.pixel(1, 0), qRgba(245, 235, 225, 255));

        layer.filters.invert = false;
        layer.filters.desaturate = true;
        QImage gray = LayerEffectRenderer::composite(layer);
        const int level = qGray(200, 100, 50);
        QCOMPARE(gray.pixel(0, 0), qRgba(level, level, level, 255));

        // the source is not touched
        QCOMPARE(layer.source.pixel(0, 0), qRgba(200, 100, 50, 255));
    }

    void testMaskHidesUncoveredPixels() {
        Layer layer("masked", LayerType::Graphic, 10, 10);
        layer.ensureSource();
        layer.source.fill(Qt::red);
        layer.mask = Layer::createRaster(5, 5);
        layer.mask.fill(Qt::black);
        layer.maskX = 5;
        layer.maskY = 5;

        const QImage result = LayerEffectRenderer::composite(layer);
        QCOMPARE(qAlpha(result.pixel(2, 2)), 0);
        QCOMPARE(qAlpha(result.pixel(9, 2)), 0);
        QCOMPARE(result.pixelColor(7, 7), QColor(Qt::red));
    }

    void testDisposeFlushesEntry() {
        ManualScheduler scheduler;
        auto document = Document::createNew("effects", 50, 50);
        PaintCanvas canvas(document.get(), scheduler);
        const QString id = document->layer(0)->id;

        canvas.createSprite(id);
        QVERIFY(canvas.effectCache().isRecomputePending(id));
        canvas.renderFrame();
        QVERIFY(canvas.effectCache().contains(id));

        canvas.sprites().disposeSpriteForLayer(id);
        QVERIFY(!canvas.effectCache().contains(id));
        QCOMPARE(scheduler.runFrame(), 0);
    }

    void testPaintRecomputesOncePerFrame() {
        ManualScheduler scheduler;
        auto document = Document::createNew("effects", 50, 50);
        PaintCanvas canvas(document.get(), scheduler);
        LayerEffectRenderer* counter = installCountingRenderer(canvas);
        Layer* layer = document->layer(0);

        LayerSprite* sprite = canvas.createSprite(layer->id);
        canvas.renderFrame();
        QCOMPARE(counter->renderCount(), 1);

        canvas.setActiveColor(Qt::blue);
        sprite->handleActiveTool(ToolType::Fill, BrushOptions(), *document);
        sprite->handlePress(10, 10);
        sprite->handlePress(20, 20);
        QVERIFY(!canvas.effectCache().isValid(layer->id, EffectCache::Property::Bitmap));

        canvas.renderFrame();
        QCOMPARE(counter->renderCount(), 2);
        QCOMPARE(sprite->bitmap().pixelColor(0, 0), QColor(Qt::blue));
    }

    void testCanvasDestructionWithdrawsRecompute() {
        ManualScheduler scheduler;
        auto document = Document::createNew("effects", 50, 50);
        Layer* layer = document->layer(0);
        {
            PaintCanvas canvas(document.get(), scheduler);
            LayerSprite* sprite = canvas.createSprite(layer->id);
            sprite->handleActiveTool(ToolType::Fill, BrushOptions(), *document);
            sprite->handlePress(10, 10);
            sprite->handleActiveTool(ToolType::None, BrushOptions(), *document);
            QCOMPARE(canvas.history().undoCount(), 1);
            canvas.renderFrame();

            // undo without a sprite schedules the recompute on the cache itself
            canvas.sprites().disposeSpriteForLayer(layer->id);
            QVERIFY(canvas.history().undo());
            QVERIFY(canvas.effectCache().isRecomputePending(layer->id));
        }
        QCOMPARE(scheduler.runFrame(), 0);
    }
};
