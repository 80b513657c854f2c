#include "Layer.h"

#include <QUuid>
#include <QtMath>
#include <cmath>

Layer::Layer()
{
    id = QUuid::createUuid().toString(QUuid::WithoutBraces);
}

Layer::Layer(const QString& layerName, LayerType layerType, int layerWidth, int layerHeight)
    : name(layerName)
    , type(layerType)
    , width(layerWidth)
    , height(layerHeight)
{
    id = QUuid::createUuid().toString(QUuid::WithoutBraces);
}

Layer Layer::fromImage(const QString& layerName, const QImage& image)
{
    Layer layer(layerName, LayerType::Image, image.width(), image.height());
    layer.source = image.convertToFormat(RASTER_FORMAT);
    return layer;
}

bool Layer::ensureSource()
{
    if (!source.isNull() || width <= 0 || height <= 0) {
        return false;
    }
    source = createRaster(width, height);
    return true;
}

void Layer::createMask()
{
    mask = createRaster(width, height);
    mask.fill(Qt::black);
    maskX = 0.0;
    maskY = 0.0;
}

void Layer::removeMask()
{
    mask = QImage();
    maskX = 0.0;
    maskY = 0.0;
}

bool Layer::isRotated() const
{
    return !qFuzzyIsNull(std::fmod(effects.rotation, 360.0));
}

bool Layer::isScaled() const
{
    return !qFuzzyCompare(effects.scale, 1.0);
}

QImage Layer::createRaster(int rasterWidth, int rasterHeight)
{
    QImage raster(qMax(1, rasterWidth), qMax(1, rasterHeight), RASTER_FORMAT);
    raster.fill(Qt::transparent);
    return raster;
}
