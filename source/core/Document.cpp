// ============================================================================
// Document - Implementation
// ============================================================================

#include "Document.h"
#include "PaintCanvas.h"
#include "../math/SelectionMath.h"
#include "../math/TransformMath.h"
#include "../rendering/SelectionClipper.h"
#include "../rendering/EffectRenderer.h"

#include <QUuid>
#include <QPainter>
#include <algorithm>

// ===== Constructors =====

Document::Document()
{
    id = QUuid::createUuid().toString(QUuid::WithoutBraces);
}

Document::Document(const QString& docName, int docWidth, int docHeight)
    : name(docName)
    , width(docWidth)
    , height(docHeight)
{
    id = QUuid::createUuid().toString(QUuid::WithoutBraces);
}

std::unique_ptr<Document> Document::createNew(const QString& docName, int docWidth, int docHeight)
{
    auto doc = std::make_unique<Document>(docName, docWidth, docHeight);
    doc->addLayer(QStringLiteral("Layer 1"));
    return doc;
}

// ===== Layer Management =====

Layer* Document::layer(int index)
{
    if (index >= 0 && index < layerCount()) {
        return m_layers[index].get();
    }
    return nullptr;
}

const Layer* Document::layer(int index) const
{
    if (index >= 0 && index < layerCount()) {
        return m_layers[index].get();
    }
    return nullptr;
}

Layer* Document::layerById(const QString& layerId)
{
    const int index = indexOf(layerId);
    return index >= 0 ? m_layers[index].get() : nullptr;
}

const Layer* Document::layerById(const QString& layerId) const
{
    const int index = indexOf(layerId);
    return index >= 0 ? m_layers[index].get() : nullptr;
}

int Document::indexOf(const QString& layerId) const
{
    for (int i = 0; i < layerCount(); ++i) {
        if (m_layers[i]->id == layerId) {
            return i;
        }
    }
    return -1;
}

Layer* Document::addLayer(std::unique_ptr<Layer> layer)
{
    if (!layer) {
        return nullptr;
    }
    Layer* ptr = layer.get();
    m_layers.push_back(std::move(layer));
    return ptr;
}

Layer* Document::addLayer(const QString& layerName)
{
    auto layer = std::make_unique<Layer>(layerName, LayerType::Graphic, width, height);
    layer->ensureSource();
    return addLayer(std::move(layer));
}

bool Document::removeLayer(const QString& layerId)
{
    const int index = indexOf(layerId);
    if (index < 0) {
        return false;
    }
    m_layers.erase(m_layers.begin() + index);
    return true;
}

bool Document::moveLayer(int from, int to)
{
    const int count = layerCount();
    if (from < 0 || from >= count || to < 0 || to >= count || from == to) {
        return false;
    }
    auto layer = std::move(m_layers[from]);
    m_layers.erase(m_layers.begin() + from);
    m_layers.insert(m_layers.begin() + to, std::move(layer));
    return true;
}

// ===== Selection =====

void Document::setSelection(const QVector<QPointF>& points, bool invert)
{
    if (!SelectionMath::isUsableSelection(points)) {
        clearSelection();
        return;
    }
    m_selection = points;
    m_invertSelection = invert;
}

void Document::clearSelection()
{
    m_selection.clear();
    m_invertSelection = false;
}

// ===== Utilities =====

QVector<QRectF> Document::alignableGuides(const QString& excludeLayerId) const
{
    const QRectF documentBounds(0, 0, width, height);
    QVector<QRectF> guides;

    auto addGuidesFor = [&](const QRectF& bounds) {
        // horizontal guides: top, center and bottom
        if (bounds.top() > 0) {
            guides.append(QRectF(0, bounds.top(), width, 0));
        }
        guides.append(QRectF(0, bounds.top() + bounds.height() / 2.0, width, 0));
        if (bounds.bottom() < documentBounds.height()) {
            guides.append(QRectF(0, bounds.bottom(), width, 0));
        }
        // vertical guides: left, center and right
        if (bounds.left() > 0) {
            guides.append(QRectF(bounds.left(), 0, 0, height));
        }
        guides.append(QRectF(bounds.left() + bounds.width() / 2.0, 0, 0, height));
        if (bounds.right() < documentBounds.width()) {
            guides.append(QRectF(bounds.right(), 0, 0, height));
        }
    };

    addGuidesFor(documentBounds);

    for (const auto& layer : m_layers) {
        if (!layer->visible || layer->id == excludeLayerId) {
            continue;
        }
        // a layer covering the document exactly adds nothing the document does not
        if (TransformMath::areEqual(layer->bounds(), documentBounds)) {
            continue;
        }
        addGuidesFor(TransformMath::transformedBounds(*layer));
    }
    return guides;
}

QImage Document::eraseSelectionContent(const Layer& layer) const
{
    QImage result = (layer.hasMask() ? layer.mask : layer.source).copy();
    if (result.isNull() || !SelectionMath::isUsableSelection(m_selection)) {
        return result;
    }

    QTransform toRaster = TransformMath::layerTransform(layer).inverted();
    if (layer.hasMask()) {
        toRaster *= QTransform::fromTranslate(-layer.maskX, -layer.maskY);
    }

    QPainter painter(&result);
    painter.setTransform(toRaster);
    painter.setCompositionMode(QPainter::CompositionMode_Clear);
    SelectionClipper::clipPainterToSelection(painter, m_selection, 0, 0, m_invertSelection);
    painter.fillRect(TransformMath::transformedBounds(layer).adjusted(-1, -1, 1, 1), Qt::transparent);
    painter.end();
    return result;
}

QImage Document::copySelection(const Layer& layer, bool merged) const
{
    if (!SelectionMath::isUsableSelection(m_selection) || width <= 0 || height <= 0) {
        return QImage();
    }

    QImage full(width, height, Layer::RASTER_FORMAT);
    full.fill(Qt::transparent);
    {
        QPainter painter(&full);
        SelectionClipper::clipPainterToSelection(painter, m_selection, 0, 0, m_invertSelection);
        if (merged) {
            for (const auto& visibleLayer : m_layers) {
                if (visibleLayer->visible) {
                    PaintCanvas::drawLayer(painter, *visibleLayer, LayerEffectRenderer::composite(*visibleLayer));
                }
            }
        } else {
            PaintCanvas::drawLayer(painter, layer, LayerEffectRenderer::composite(layer));
        }
    }

    // an inverted selection spans everything but the polygon
    if (m_invertSelection) {
        return full;
    }
    return full.copy(SelectionMath::selectionBounds(m_selection).toAlignedRect());
}
