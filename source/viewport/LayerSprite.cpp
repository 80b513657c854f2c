#include "LayerSprite.h"

#include "../core/Document.h"
#include "../core/Layer.h"
#include "../core/PaintCanvas.h"
#include "../math/SelectionMath.h"
#include "../math/TransformMath.h"
#include "../math/UnitMath.h"
#include "../rendering/CloneRenderer.h"
#include "../rendering/FloodFill.h"
#include "../rendering/GuideSnapping.h"
#include "../rendering/SelectionClipper.h"

#include <QDebug>
#include <QPainter>
#include <QPen>
#include <QtMath>

namespace {

const QColor OUTLINE_COLOR(0x99, 0x99, 0x99);

// Sprites are resolved by layer id on every replay: the sprite that recorded
// an entry may have been disposed and recreated since.

void recacheLayer(PaintCanvas& canvas, const QString& layerId)
{
    const bool hasSprite = canvas.sprites().runSpriteFn(layerId, [](LayerSprite& sprite) {
        sprite.resetFilterAndRecache();
    });
    if (!hasSprite) {
        canvas.effectCache().invalidate(layerId, EffectCache::Property::Filters);
        canvas.effectCache().requestRecompute(layerId);
    }
}

void restorePaintFromHistory(PaintCanvas& canvas, const QString& layerId, bool onMask,
                             const PaintSnapshot& snapshot)
{
    Layer* layer = canvas.document() ? canvas.document()->layerById(layerId) : nullptr;
    if (!layer) {
        qWarning() << "LayerSprite::restorePaintFromHistory: layer" << layerId << "no longer exists";
        return;
    }
    QImage& buffer = onMask ? layer->mask : layer->source;
    if (!snapshot.restoreInto(buffer)) {
        qWarning() << "LayerSprite::restorePaintFromHistory: failed to restore" << layerId;
        return;
    }
    recacheLayer(canvas, layerId);
}

void positionFromHistory(PaintCanvas& canvas, const QString& layerId,
                         const QPointF& spritePosition, const QPointF& layerPosition)
{
    // Missing sprite: only the layer fields are restored
    canvas.sprites().runSpriteFn(layerId, [&spritePosition](LayerSprite& sprite) {
        sprite.restoreBoundsPosition(spritePosition);
    });
    if (Layer* layer = canvas.document() ? canvas.document()->layerById(layerId) : nullptr) {
        layer->left = layerPosition.x();
        layer->top = layerPosition.y();
    }
}

void maskPositionFromHistory(PaintCanvas& canvas, const QString& layerId, const QPointF& offset)
{
    Layer* layer = canvas.document() ? canvas.document()->layerById(layerId) : nullptr;
    if (!layer) {
        return;
    }
    layer->maskX = offset.x();
    layer->maskY = offset.y();
    recacheLayer(canvas, layerId);
}

void renderCross(QPainter& painter, const QPointF& center, qreal size)
{
    painter.drawLine(QPointF(center.x() - size, center.y()), QPointF(center.x() + size, center.y()));
    painter.drawLine(QPointF(center.x(), center.y() - size), QPointF(center.x(), center.y() + size));
}

} // namespace

LayerSprite::LayerSprite(Layer& layer, PaintCanvas& canvas)
    : QObject(nullptr)
    , m_layer(&layer)
    , m_canvas(canvas)
    , m_layerId(layer.id)
{
    // Graphic and text layers render into a raster of their own
    if (layer.type == LayerType::Graphic || layer.type == LayerType::Text) {
        layer.ensureSource();
    }
    m_brush = Brush::create(canvas.activeColor(), BrushOptions());

    setActionTarget();
    syncPosition();
    cacheEffects();
}

LayerSprite::~LayerSprite()
{
    dispose();
}

const QString& LayerSprite::layerId() const
{
    return m_layerId;
}

LayerSprite::State LayerSprite::state() const
{
    if (m_brush.down) {
        return State::Stroking;
    }
    return m_toolType == ToolType::None ? State::Idle : State::ToolArmed;
}

// ===== Capabilities =====

bool LayerSprite::isDrawable() const
{
    return m_layer->type == LayerType::Graphic || isMaskable();
}

bool LayerSprite::isMaskable() const
{
    return m_layer->hasMask() && m_canvas.maskEditLayerId() == m_layerId;
}

void LayerSprite::setActionTarget(ActionTarget target)
{
    if (target != m_actionTarget) {
        commitPendingPaintState();
    }
    m_actionTarget = target;
}

// ===== Geometry =====

QRectF LayerSprite::actualBounds() const
{
    if (!m_layer->isRotated() && !m_layer->isScaled()) {
        return m_bounds;
    }
    return TransformMath::rotateRectangle(
        TransformMath::scaleRectangle(m_bounds, m_layer->effects.scale),
        UnitMath::degreesToRadians(m_layer->effects.rotation));
}

bool LayerSprite::insideBounds(qreal x, qreal y) const
{
    const QRectF bounds = actualBounds();
    return x >= bounds.left() && x <= bounds.right() &&
           y >= bounds.top() && y <= bounds.bottom();
}

void LayerSprite::syncPosition()
{
    m_bounds = QRectF(m_layer->left, m_layer->top, m_layer->width, m_layer->height);
    invalidate();
}

void LayerSprite::setBounds(qreal x, qreal y, qreal width, qreal height)
{
    if (m_disposed) {
        return;
    }
    const QPointF oldPosition = m_bounds.topLeft();
    const QPointF oldLayerPosition(m_layer->left, m_layer->top);

    if (qFuzzyIsNull(width) || qFuzzyIsNull(height)) {
        width = m_bounds.width();
        height = m_bounds.height();
    }
    m_bounds = QRectF(x, y, width, height);

    // The layer moves by the same delta: rotated layers keep a sprite
    // position that differs from the layer's own
    const QPointF newPosition = m_bounds.topLeft();
    const QPointF newLayerPosition = oldLayerPosition + (newPosition - oldPosition);
    m_layer->left = newLayerPosition.x();
    m_layer->top = newLayerPosition.y();

    PaintCanvas* canvas = &m_canvas;
    const QString layerId = m_layerId;

    HistoryEntry entry;
    entry.undo = [canvas, layerId, oldPosition, oldLayerPosition]() {
        positionFromHistory(*canvas, layerId, oldPosition, oldLayerPosition);
    };
    entry.redo = [canvas, layerId, newPosition, newLayerPosition]() {
        positionFromHistory(*canvas, layerId, newPosition, newLayerPosition);
    };
    // a drag produces one entry
    m_canvas.history().enqueue(QStringLiteral("spritePos_") + m_layerId, std::move(entry), m_dragging);

    invalidate();
}

void LayerSprite::restoreBoundsPosition(const QPointF& position)
{
    m_bounds.moveTopLeft(position);
    invalidate();
}

// ===== Brush & effects =====

void LayerSprite::cacheBrush(const QColor& color, const BrushOptions& options)
{
    m_brush = Brush::create(color, options, m_brush.pointers);
}

void LayerSprite::storeBrushPointer(qreal x, qreal y)
{
    m_brush.down = true;
    m_brush.pointers.append(QPointF(x, y));
}

void LayerSprite::cacheEffects()
{
    if (m_disposed) {
        return;
    }
    // at most once per frame
    m_canvas.effectCache().requestRecompute(m_layerId);
}

void LayerSprite::resetFilterAndRecache()
{
    // the filters must be applied to the new contents
    m_canvas.effectCache().invalidate(m_layerId, EffectCache::Property::Filters);
    cacheEffects();
    invalidate();
}

QImage LayerSprite::bitmap() const
{
    return m_canvas.layerBitmap(*m_layer);
}

// ===== Tool handling =====

void LayerSprite::handleActiveLayer(const QString& activeLayerId)
{
    setInteractive(m_layerId == activeLayerId);
}

void LayerSprite::setSelection(const Document& document, bool onlyWhenClosed)
{
    const QVector<QPointF>& selection = document.selection();
    const bool drawOnMask = m_actionTarget == ActionTarget::Mask && isMaskable();

    bool keep = true;
    if (onlyWhenClosed) {
        keep = canDrawOnSelection(*m_layer) &&
               (drawOnMask || SelectionMath::isSelectionClosed(selection));
    }
    if (keep && SelectionMath::isUsableSelection(selection)) {
        m_selection = selection;
        m_invertSelection = document.invertSelection();
    } else {
        resetSelection();
    }
}

void LayerSprite::resetSelection()
{
    m_selection.clear();
    m_invertSelection = false;
}

void LayerSprite::handleActiveTool(ToolType tool, const BrushOptions& options, const Document& document)
{
    if (m_disposed) {
        return;
    }

    // Switching tools must not lose history: finish the stroke and commit
    if (m_brush.down) {
        qDebug() << "LayerSprite::handleActiveTool: finishing stroke on" << m_layerId;
        finishStroke();
    }
    storePaintState();

    resetInteractionState();

    if (!m_interactive || tool == ToolType::None) {
        invalidate();
        return;
    }

    m_toolType = tool;
    m_toolOptions = options;

    switch (tool) {
        case ToolType::Drag:
            m_dragMode = true;
            break;
        case ToolType::Fill:
        case ToolType::Eraser:
        case ToolType::Brush:
        case ToolType::Clone:
            forceMoveListener();
            m_paintMode = true;
            cacheBrush(m_canvas.activeColor(), options);
            // drawing tools work alongside an existing selection
            setSelection(document, true);
            break;
        case ToolType::Eyedropper:
            m_colorPicker = true;
            break;
        case ToolType::None:
            break;
    }
    invalidate();
}

void LayerSprite::forceMoveListener()
{
    m_moveListening = true;
    m_dragBoundsStart = m_bounds.topLeft();
    m_dragEventStart = m_pointer;
}

void LayerSprite::resetInteractionState()
{
    if (m_maskDragging || m_dragging) {
        m_canvas.history().seal();
    }
    if (m_canvas.draggingSprite() == this) {
        m_canvas.setDraggingSprite(nullptr);
    }
    m_dragging = false;
    m_maskDragging = false;
    m_paintMode = false;
    m_dragMode = false;
    m_colorPicker = false;
    m_moveListening = false;
    m_toolType = ToolType::None;
    m_toolOptions = BrushOptions();
    m_hasCloneStart = false;
    m_cloneStart = QPointF();
    m_preview.reset();
    resetSelection();
}

// ===== Painting =====

QImage& LayerSprite::destinationBuffer(bool drawOnMask) const
{
    return drawOnMask ? m_layer->mask : m_layer->source;
}

QPointF LayerSprite::destinationOffset(bool drawOnMask) const
{
    return drawOnMask ? QPointF(m_layer->maskX, m_layer->maskY) : QPointF();
}

QVector<QPointF> LayerSprite::toDestinationSpace(const QVector<QPointF>& points, bool drawOnMask) const
{
    const QPointF offset = destinationOffset(drawOnMask);
    QVector<QPointF> result = TransformMath::toLayerSpace(points, *m_layer);
    for (QPointF& point : result) {
        point -= offset;
    }
    return result;
}

QVector<QPointF> LayerSprite::toMirroredDestinationSpace(const QVector<QPointF>& points, bool drawOnMask) const
{
    QVector<QPointF> result = toDestinationSpace(points, drawOnMask);
    const bool mirrorX = m_layer->effects.mirrorX;
    const bool mirrorY = m_layer->effects.mirrorY;
    if (!mirrorX && !mirrorY) {
        return result;
    }
    for (QPointF& point : result) {
        if (mirrorX) point.setX(-point.x());
        if (mirrorY) point.setY(-point.y());
    }
    return result;
}

void LayerSprite::paint(const PaintAction* action)
{
    if (m_disposed || (!action && !isDrawingTool(m_toolType))) {
        return;
    }
    // 1. resolve the destination raster
    const bool drawOnMask = m_actionTarget == ActionTarget::Mask && isMaskable();

    // the pending "before" snapshot only covers one buffer
    if (hasPendingPaintState() && drawOnMask != m_pendingOnMask) {
        commitPendingPaintState();
    }
    if (!hasPendingPaintState()) {
        preparePendingPaintState();
    }
    QImage& destination = destinationBuffer(drawOnMask);
    if (destination.isNull()) {
        qWarning() << "LayerSprite::paint: no raster to paint on for" << m_layerId;
        return;
    }

    const bool isEraser = m_toolType == ToolType::Eraser;
    const bool antiAlias = m_canvas.preferences().antiAlias;

    // while the brush is down, paint in low resolution preview mode
    // unless erasing a mask
    const bool isLowResPreview = !action && m_brush.down && !(drawOnMask && isEraser);
    const bool toPreview = isLowResPreview &&
                           (m_toolType == ToolType::Brush || m_toolType == ToolType::Eraser);

    const bool actionSelection = action && !action->selection.isEmpty();
    const QVector<QPointF>& selectionPoints = actionSelection ? action->selection : m_selection;
    const bool invert = actionSelection ? action->invertSelection : m_invertSelection;
    const bool hasSelection = SelectionMath::isUsableSelection(selectionPoints);

    // Reads happen before the destination painter is opened
    QImage cloneSource;
    const Layer* cloneLayer = nullptr;
    QImage fillOverlay;
    if (!action && m_toolType == ToolType::Clone && m_brush.down) {
        const QString sourceId = m_toolOptions.sourceLayerId.isEmpty() ? m_layerId : m_toolOptions.sourceLayerId;
        cloneLayer = m_canvas.document() ? m_canvas.document()->layerById(sourceId) : nullptr;
        if (!cloneLayer || cloneLayer->source.isNull()) {
            qWarning() << "LayerSprite::paint: clone source layer" << sourceId << "not available";
            cloneLayer = nullptr;
        } else {
            cloneSource = cloneLayer->source.copy();
        }
    } else if (!action && m_toolType == ToolType::Fill && m_toolOptions.smartFill) {
        const QPointF start = toDestinationSpace({ m_pointer }, drawOnMask).first();
        fillOverlay = FloodFill::floodFill(destination, qFloor(start.x()), qFloor(start.y()),
                                           m_canvas.activeColor());
    }

    BrushOverrides overrides;
    QImage* target = &destination;
    if (toPreview) {
        if (!m_preview) {
            m_preview = std::make_unique<LowResPreview>(m_canvas.viewport(), m_canvas.zoomFactor());
        }
        overrides = m_preview->createOverrides(slicePointers(m_brush));
        target = &m_preview->image();
    }

    QPainter painter(target);
    painter.save(); // 2. preparation save

    // 3. constrain to the selection. Full resolution passes work in raster
    // space, the preview already works in (scaled) document space.
    if (hasSelection) {
        painter.save(); // clipping save
        if (toPreview) {
            SelectionClipper::clipPainterToSelection(painter, selectionPoints, 0, 0, invert, &overrides);
        } else {
            SelectionClipper::clipPainterToSelection(painter, toDestinationSpace(selectionPoints, drawOnMask),
                                                     0, 0, invert);
        }
    }

    // 4. tool dispatch
    if (action) {
        switch (action->type) {
            case PaintAction::Type::Stroke: {
                const QPainterPath path = SelectionClipper::selectionPath(
                    toDestinationSpace(selectionPoints, drawOnMask), 0, 0);
                painter.setRenderHint(QPainter::Antialiasing, antiAlias);
                painter.strokePath(path, QPen(action->color, action->size * m_canvas.documentScale()));
                break;
            }
        }
    } else {
        switch (m_toolType) {
            case ToolType::Fill:
                if (m_toolOptions.smartFill) {
                    if (!fillOverlay.isNull()) {
                        painter.drawImage(0, 0, fillOverlay);
                    }
                } else {
                    // the clip limits the fill to the selection
                    painter.fillRect(destination.rect(), m_canvas.activeColor());
                }
                break;
            case ToolType::Clone:
                // clone writes go straight to the layer
                if (cloneLayer) {
                    renderClone(painter, cloneSource, *cloneLayer, slicePointers(m_brush), drawOnMask);
                }
                break;
            case ToolType::Brush:
            case ToolType::Eraser:
                if (toPreview) {
                    renderBrushStroke(painter, m_brush, &overrides, antiAlias);
                } else {
                    renderFullResolutionStroke(painter, destination, drawOnMask);
                }
                break;
            case ToolType::None:
            case ToolType::Drag:
            case ToolType::Eyedropper:
                break;
        }
    }

    // 5. restore in reverse order
    if (hasSelection) {
        painter.restore(); // clipping restore
    }
    painter.restore(); // preparation restore
    painter.end();

    // 6. effects are recomputed after full resolution passes only
    if (!isLowResPreview) {
        resetFilterAndRecache();
    }
    emit paintApplied(isLowResPreview);
    invalidate();
}

void LayerSprite::renderClone(QPainter& painter, const QImage& sourcePixels, const Layer& sourceLayer,
                              const QVector<QPointF>& pointers, bool drawOnMask)
{
    if (!m_toolOptions.hasCloneSource || !m_hasCloneStart) {
        return;
    }
    // destination document point d reads source document point d - (start - source)
    const QPointF offset = m_cloneStart - m_toolOptions.cloneSource;
    const QPointF destinationOrigin = destinationOffset(drawOnMask);

    const QTransform documentToDestination = TransformMath::layerTransform(*m_layer).inverted() *
        QTransform::fromTranslate(-destinationOrigin.x(), -destinationOrigin.y());
    const QTransform sourceToDestination = TransformMath::layerTransform(sourceLayer) *
        QTransform::fromTranslate(offset.x(), offset.y()) * documentToDestination;

    CloneRenderer::renderClonedStroke(painter, m_brush, sourcePixels, sourceToDestination,
                                      toDestinationSpace(pointers, drawOnMask),
                                      m_canvas.preferences().antiAlias);
}

void LayerSprite::renderFullResolutionStroke(QPainter& painter, const QImage& destination, bool drawOnMask)
{
    const bool mirrorX = m_layer->effects.mirrorX;
    const bool mirrorY = m_layer->effects.mirrorY;
    const qreal scale = qFuzzyIsNull(m_layer->effects.scale) ? 1.0 : m_layer->effects.scale;

    // Render the complete path into a scratch raster first so overlapping
    // segments do not compound the brush opacity
    QImage scratch = Layer::createRaster(destination.width(), destination.height());
    {
        QPainter scratchPainter(&scratch);
        scratchPainter.scale(mirrorX ? -1 : 1, mirrorY ? -1 : 1);

        Brush fullBrush = m_brush;
        fullBrush.pointers = toMirroredDestinationSpace(m_brush.pointers, drawOnMask);
        fullBrush.radius = m_brush.radius / qAbs(scale);
        renderBrushStroke(scratchPainter, fullBrush, nullptr, m_canvas.preferences().antiAlias);
    }

    painter.setOpacity(m_brush.options.opacity);
    if (m_toolType == ToolType::Eraser) {
        painter.setCompositionMode(QPainter::CompositionMode_DestinationOut);
    }
    painter.drawImage(0, 0, scratch);
}

void LayerSprite::strokeSelection(const QColor& color, qreal size)
{
    const Document* document = m_canvas.document();
    if (!document || !SelectionMath::isUsableSelection(document->selection())) {
        return;
    }
    PaintAction action;
    action.type = PaintAction::Type::Stroke;
    action.color = color;
    action.size = size;
    action.selection = document->selection();
    action.invertSelection = document->invertSelection();
    paint(&action);
}

// ===== Snapshot debounce =====

void LayerSprite::preparePendingPaintState()
{
    m_pendingOnMask = m_actionTarget == ActionTarget::Mask && isMaskable();
    m_pendingBefore = PaintSnapshot::capture(destinationBuffer(m_pendingOnMask));
    debouncePaintStore(m_canvas.preferences().paintCommitDelay);
}

void LayerSprite::debouncePaintStore(int timeoutMs)
{
    Scheduler& scheduler = m_canvas.scheduler();
    if (m_commitTask != 0) {
        scheduler.cancel(m_commitTask);
    }
    m_commitTask = scheduler.schedule(timeoutMs, [this]() {
        storePaintState();
    });
}

bool LayerSprite::storePaintState()
{
    if (m_commitTask == 0) {
        return true;
    }
    if (m_brush.down) {
        // still painting, the layer is only updated on release
        debouncePaintStore(m_canvas.preferences().paintRecommitDelay);
        return false;
    }
    return commitPendingPaintState();
}

bool LayerSprite::commitPendingPaintState()
{
    if (m_commitTask == 0) {
        return true;
    }
    m_canvas.scheduler().cancel(m_commitTask);
    m_commitTask = 0;

    std::shared_ptr<const PaintSnapshot> before = std::move(m_pendingBefore);
    m_pendingBefore.reset();
    const bool onMask = m_pendingOnMask;
    std::shared_ptr<const PaintSnapshot> after = PaintSnapshot::capture(destinationBuffer(onMask));

    if (!before || !after) {
        qWarning() << "LayerSprite::commitPendingPaintState: snapshot unavailable, skipping history entry for" << m_layerId;
        return false;
    }

    PaintCanvas* canvas = &m_canvas;
    const QString layerId = m_layerId;

    HistoryEntry entry;
    entry.undo = [canvas, layerId, onMask, before]() {
        restorePaintFromHistory(*canvas, layerId, onMask, *before);
    };
    entry.redo = [canvas, layerId, onMask, after]() {
        restorePaintFromHistory(*canvas, layerId, onMask, *after);
    };
    entry.resources = { before, after };
    m_canvas.history().enqueue(QStringLiteral("spritePaint_") + layerId, std::move(entry));
    return true;
}

// ===== Pointer input =====

void LayerSprite::handlePress(qreal x, qreal y, PointerKind kind)
{
    Q_UNUSED(kind);
    if (m_disposed) {
        return;
    }
    const QPointF point(x, y);
    m_pointer = point;

    if (m_colorPicker) {
        const QColor color = m_canvas.colorAt(point);
        m_canvas.setActiveColor(color);
        emit colorPicked(color);
        return;
    }

    if (m_paintMode) {
        if (m_toolType == ToolType::Clone) {
            // first press sets the source anchor, the second one starts the stroke
            if (!m_toolOptions.hasCloneSource) {
                m_toolOptions.setCloneSource(point);
                m_brush.options = m_toolOptions;
                m_hasCloneStart = false;
                invalidate();
                return;
            }
            if (!m_hasCloneStart) {
                m_cloneStart = point;
                m_hasCloneStart = true;
            }
        } else if (m_toolType == ToolType::Fill) {
            paint();
            return;
        }
        storeBrushPointer(x, y);
        return;
    }

    if (m_actionTarget == ActionTarget::Mask && m_layer->hasMask()) {
        m_maskDragging = true;
        m_maskDragStart = QPointF(m_layer->maskX, m_layer->maskY);
        m_dragEventStart = point;
        return;
    }

    if (m_dragMode) {
        m_canvas.setDraggingSprite(this);
        m_dragging = true;
        m_dragEventStart = point;
        m_dragBoundsStart = m_bounds.topLeft();
    }
}

void LayerSprite::handleMove(qreal x, qreal y, PointerKind kind)
{
    if (m_disposed) {
        return;
    }
    const QPointF point(x, y);

    // touch positions are stored on press
    if (kind != PointerKind::Touch) {
        m_pointer = point;
    }

    if (!m_paintMode) {
        if (m_maskDragging) {
            const QPointF oldOffset(m_layer->maskX, m_layer->maskY);
            const QPointF newOffset = m_maskDragStart + (point - m_dragEventStart);
            PaintCanvas* canvas = &m_canvas;
            const QString layerId = m_layerId;

            maskPositionFromHistory(m_canvas, m_layerId, newOffset);

            HistoryEntry entry;
            entry.undo = [canvas, layerId, oldOffset]() {
                maskPositionFromHistory(*canvas, layerId, oldOffset);
            };
            entry.redo = [canvas, layerId, newOffset]() {
                maskPositionFromHistory(*canvas, layerId, newOffset);
            };
            m_canvas.history().enqueue(QStringLiteral("maskPos_") + m_layerId, std::move(entry), true);
            return;
        }
        if (m_dragging) {
            const QPointF delta = point - m_dragEventStart;
            setBounds(m_dragBoundsStart.x() + delta.x(), m_dragBoundsStart.y() + delta.y());
            return;
        }
    }

    // painting of the recorded pointers is deferred to update()
    if (m_brush.down) {
        storeBrushPointer(x, y);
    }
    if (m_moveListening) {
        invalidate();
    }
}

void LayerSprite::handleRelease(qreal x, qreal y)
{
    Q_UNUSED(x);
    Q_UNUSED(y);
    if (m_disposed) {
        return;
    }

    if (m_brush.down) {
        finishStroke();
        if (!m_canvas.preferences().lowMemory) {
            storePaintState();
        }
    }

    if (m_paintMode) {
        forceMoveListener();
        return;
    }

    if (m_maskDragging) {
        m_maskDragging = false;
        m_canvas.history().seal();
    }
    if (m_dragMode) {
        if (m_dragging && m_canvas.preferences().snapAlign && m_canvas.document()) {
            GuideSnapping::snapSpriteToGuide(*this, m_canvas.document()->alignableGuides(m_layerId),
                                             m_canvas.preferences().snapMargin);
        }
        if (m_dragging) {
            m_canvas.history().seal();
        }
        m_dragging = false;
        m_canvas.setDraggingSprite(nullptr);
    }
}

void LayerSprite::finishStroke()
{
    m_preview.reset();
    m_brush.down = false;
    m_brush.last = 0;
    paint();
    m_brush.pointers.clear();
}

void LayerSprite::update()
{
    if (m_disposed || !m_brush.down) {
        return;
    }
    paint();
    m_brush.last = m_brush.pointers.size();
}

// ===== Rendering =====

void LayerSprite::draw(QPainter& painter, const QRectF& viewport, bool omitOutlines)
{
    if (m_disposed || !m_layer->visible) {
        return;
    }

    if (viewport.isEmpty() || actualBounds().intersects(viewport)) {
        PaintCanvas::drawLayer(painter, *m_layer, bitmap());
    }

    // live stroke in progress: show the low resolution preview
    if (m_preview) {
        painter.save();
        painter.setOpacity(m_brush.options.opacity);
        if (m_toolType == ToolType::Eraser || isMaskable()) {
            painter.setCompositionMode(QPainter::CompositionMode_DestinationOut);
        }
        m_preview->render(painter);
        painter.restore();
    }

    if (omitOutlines || !m_paintMode) {
        return;
    }

    const qreal zoom = m_canvas.zoomFactor();
    painter.save();
    painter.setRenderHint(QPainter::Antialiasing, true);
    painter.setBrush(Qt::NoBrush);
    painter.setPen(QPen(OUTLINE_COLOR, 2.0 / zoom));

    if (m_toolType == ToolType::Clone) {
        // the cross marks where pixels are read from
        QPointF cross = m_pointer;
        if (m_toolOptions.hasCloneSource) {
            const QPointF relativeSource = m_hasCloneStart ? m_cloneStart : m_dragEventStart;
            cross = m_toolOptions.cloneSource + (m_pointer - relativeSource);
        }
        if (!m_toolOptions.hasCloneSource || m_brush.down) {
            renderCross(painter, cross, m_brush.radius / zoom);
        }
    }
    if (m_toolType != ToolType::Clone || m_toolOptions.hasCloneSource) {
        const qreal radius = getSizeForBrush(m_brush);
        painter.drawEllipse(m_pointer, radius, radius);
    }
    painter.restore();
}

void LayerSprite::dispose()
{
    if (m_disposed) {
        return;
    }
    m_disposed = true;

    EffectCache& cache = m_canvas.effectCache();
    cache.cancelRecompute(m_layerId);

    // pending snapshot is discarded, not committed
    if (m_commitTask != 0) {
        m_canvas.scheduler().cancel(m_commitTask);
        m_commitTask = 0;
    }
    m_pendingBefore.reset();
    m_preview.reset();
    m_brush.pointers.clear();
    m_brush.down = false;
    m_brush.last = 0;

    cache.flushLayer(m_layerId);
    if (m_canvas.draggingSprite() == this) {
        m_canvas.setDraggingSprite(nullptr);
    }
}
