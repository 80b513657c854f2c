#include "PaintCanvas.h"
#include "../viewport/LayerSprite.h"
#include "../math/TransformMath.h"

#include <QDebug>
#include <QPainter>

PaintCanvas::PaintCanvas(Document* document, Scheduler& scheduler,
                         const Preferences& preferences, QObject* parent)
    : QObject(parent)
    , m_document(document)
    , m_scheduler(scheduler)
    , m_preferences(preferences)
    , m_effectCache(scheduler)
{
    m_history.setMaxDepth(m_preferences.maxUndoDepth);

    m_effectRenderer = std::make_unique<LayerEffectRenderer>(m_effectCache);
    m_effectCache.setRenderer(m_effectRenderer.get());
    m_effectCache.setLayerResolver([this](const QString& layerId) -> Layer* {
        return m_document ? m_document->layerById(layerId) : nullptr;
    });

    if (m_document) {
        m_viewport = QRectF(0, 0, m_document->width, m_document->height);
    }
}

PaintCanvas::~PaintCanvas()
{
    // sprites cancel their timers and cache entries
    m_sprites.clear();
    m_history.clear();
}

void PaintCanvas::setEffectRenderer(std::unique_ptr<EffectRenderer> renderer)
{
    if (!renderer) {
        return;
    }
    m_effectRenderer = std::move(renderer);
    m_effectCache.setRenderer(m_effectRenderer.get());
}

void PaintCanvas::setPreferences(const Preferences& preferences)
{
    m_preferences = preferences;
    m_history.setMaxDepth(m_preferences.maxUndoDepth);
}

void PaintCanvas::setZoomFactor(qreal zoom)
{
    if (zoom <= 0.0) {
        qWarning() << "PaintCanvas::setZoomFactor: ignoring invalid zoom" << zoom;
        return;
    }
    m_zoomFactor = zoom;
}

void PaintCanvas::setActiveColor(const QColor& color)
{
    if (m_activeColor == color) {
        return;
    }
    m_activeColor = color;
    emit activeColorChanged(color);
}

LayerSprite* PaintCanvas::createSprite(const QString& layerId)
{
    Layer* layer = m_document ? m_document->layerById(layerId) : nullptr;
    if (!layer) {
        qWarning() << "PaintCanvas::createSprite: unknown layer" << layerId;
        return nullptr;
    }
    return m_sprites.createSpriteForLayer(*layer, *this);
}

void PaintCanvas::setActiveLayer(const QString& layerId)
{
    m_sprites.forEach([&layerId](LayerSprite& sprite) {
        sprite.handleActiveLayer(layerId);
    });
}

void PaintCanvas::renderFrame()
{
    m_sprites.forEach([](LayerSprite& sprite) {
        sprite.update();
    });
    m_scheduler.runFrame();
}

void PaintCanvas::render(QPainter& painter, bool omitOutlines)
{
    if (!m_document) {
        return;
    }
    for (const auto& layer : m_document->layers()) {
        if (!layer->visible) {
            continue;
        }
        if (LayerSprite* sprite = m_sprites.getSpriteForLayer(layer->id)) {
            sprite->draw(painter, m_viewport, omitOutlines);
        } else {
            drawLayer(painter, *layer, layerBitmap(*layer));
        }
    }
}

QColor PaintCanvas::colorAt(const QPointF& point) const
{
    if (!m_document) {
        return QColor();
    }

    QImage pixel(1, 1, Layer::RASTER_FORMAT);
    pixel.fill(Qt::transparent);
    {
        QPainter painter(&pixel);
        painter.translate(-point.x(), -point.y());
        for (const auto& layer : m_document->layers()) {
            if (layer->visible) {
                drawLayer(painter, *layer, layerBitmap(*layer));
            }
        }
    }
    return QColor::fromRgba(qUnpremultiply(pixel.pixel(0, 0)));
}

bool PaintCanvas::removeLayer(const QString& layerId)
{
    if (!m_document) {
        return false;
    }
    m_sprites.disposeSpriteForLayer(layerId);
    m_effectCache.flushLayer(layerId);
    if (m_maskEditLayerId == layerId) {
        m_maskEditLayerId.clear();
    }
    return m_document->removeLayer(layerId);
}

QImage PaintCanvas::layerBitmap(const Layer& layer) const
{
    if (m_effectCache.isValid(layer.id, EffectCache::Property::Bitmap)) {
        return m_effectCache.bitmap(layer.id);
    }
    return LayerEffectRenderer::composite(layer);
}

void PaintCanvas::drawLayer(QPainter& painter, const Layer& layer, const QImage& bitmap)
{
    if (bitmap.isNull()) {
        return;
    }
    painter.save();
    if (layer.filters.enabled && !qFuzzyCompare(layer.filters.opacity, 1.0)) {
        painter.setOpacity(painter.opacity() * layer.filters.opacity);
    }
    painter.setRenderHint(QPainter::SmoothPixmapTransform, layer.isRotated() || layer.isScaled());
    painter.setTransform(TransformMath::layerTransform(layer), true);
    painter.drawImage(QPointF(0, 0), bitmap);
    painter.restore();
}
