#include "EffectRenderer.h"
#include "EffectCache.h"
#include "../core/Layer.h"

#include <QPainter>

LayerEffectRenderer::LayerEffectRenderer(EffectCache& cache)
    : m_cache(cache)
{
}

void LayerEffectRenderer::renderEffects(Layer& layer, bool useCache)
{
    if (useCache && m_cache.isValid(layer.id, EffectCache::Property::Bitmap)) {
        return;
    }

    m_cache.store(layer.id, composite(layer), layer.filters);
    ++m_renderCount;
}

QImage LayerEffectRenderer::composite(const Layer& layer)
{
    if (layer.source.isNull()) {
        return QImage();
    }

    QImage result = layer.source.convertToFormat(Layer::RASTER_FORMAT);

    if (layer.hasMask()) {
        // Pixels not covered by the (offset) mask are hidden
        QImage alpha = Layer::createRaster(result.width(), result.height());
        {
            QPainter painter(&alpha);
            painter.drawImage(QPointF(layer.maskX, layer.maskY), layer.mask);
        }
        QPainter painter(&result);
        painter.setCompositionMode(QPainter::CompositionMode_DestinationIn);
        painter.drawImage(0, 0, alpha);
    }

    if (layer.filters.enabled && (layer.filters.desaturate || layer.filters.invert)) {
        applyFilters(result, layer.filters.desaturate, layer.filters.invert);
    }
    return result;
}

void LayerEffectRenderer::applyFilters(QImage& image, bool desaturate, bool invert)
{
    for (int y = 0; y < image.height(); ++y) {
        QRgb* line = reinterpret_cast<QRgb*>(image.scanLine(y));
        for (int x = 0; x < image.width(); ++x) {
            if (qAlpha(line[x]) == 0) {
                continue;
            }
            QRgb pixel = qUnpremultiply(line[x]);
            int r = qRed(pixel);
            int g = qGreen(pixel);
            int b = qBlue(pixel);
            if (desaturate) {
                r = g = b = qGray(r, g, b);
            }
            if (invert) {
                r = 255 - r;
                g = 255 - g;
                b = 255 - b;
            }
            line[x] = qPremultiply(qRgba(r, g, b, qAlpha(pixel)));
        }
    }
}
