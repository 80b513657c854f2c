#pragma once

// ============================================================================
// LayerSprite - Interactive paint controller and renderer of one Layer
// ============================================================================
// A LayerSprite turns tool activation and pointer events into pixel changes
// on its layer's source or mask raster.
//
// Painting model:
// - While the brush is down, pointer moves only record samples. The frame
//   update paints once per frame, rendering the new segment into a low
//   resolution preview (LowResPreview) instead of the layer.
// - On release the full path is rendered once at full resolution into the
//   layer raster, in layer space (rotation, scale and mirroring undone).
// - Clone strokes write to the layer raster directly while stroking.
// - Fill and eyedropper act instantly on press.
//
// History:
// - Raster changes are snapshotted with a debounce: the "before" snapshot is
//   captured at the first paint, the commit is armed with a delay and re-armed
//   while the brush is still down. Release (unless low memory) and tool
//   switches commit right away.
// - History closures resolve the layer and sprite through the PaintCanvas by
//   layer id at replay time.
//
// Sprites are created and disposed by the SpriteRegistry.
// ============================================================================

#include "../core/ToolType.h"
#include "../core/PaintSnapshot.h"
#include "../core/Scheduler.h"
#include "../rendering/BrushRenderer.h"
#include "../rendering/LowResPreview.h"

#include <QObject>
#include <QColor>
#include <QPointF>
#include <QRectF>
#include <QVector>
#include <memory>

class Document;
class Layer;
class PaintCanvas;
class QPainter;

/**
 * @brief Origin of a pointer event.
 *
 * Touch events only update the pointer position on press.
 */
enum class PointerKind {
    Mouse,
    Touch
};

/**
 * @brief A one-off paint operation that replaces the tool dispatch of paint().
 */
struct PaintAction {
    enum class Type {
        Stroke      ///< Outline the selection
    };
    Type type = Type::Stroke;
    QColor color;
    qreal size = 1.0;                   ///< Line width in on-screen pixels
    QVector<QPointF> selection;         ///< Polygon to use (empty = the sprite's selection)
    bool invertSelection = false;       ///< Applies to selection only
};

class LayerSprite : public QObject {
    Q_OBJECT

public:
    enum class State {
        Idle,       ///< No tool armed
        ToolArmed,  ///< Tool armed, no stroke in progress
        Stroking    ///< Brush is down
    };

    LayerSprite(Layer& layer, PaintCanvas& canvas);
    ~LayerSprite() override;

    Layer& layer() const { return *m_layer; }
    const QString& layerId() const;

    State state() const;
    ToolType toolType() const { return m_toolType; }
    const BrushOptions& toolOptions() const { return m_toolOptions; }
    const Brush& brush() const { return m_brush; }
    bool isDisposed() const { return m_disposed; }

    // ===== Capabilities =====

    /**
     * @brief Choose the buffer painting goes to.
     *
     * Commits a pending snapshot of the previous target first.
     */
    void setActionTarget(ActionTarget target = ActionTarget::Source);
    ActionTarget actionTarget() const { return m_actionTarget; }

    /// Graphic layers and layers whose mask is being edited accept drawing tools.
    bool isDrawable() const;

    /// The layer has a mask and it is the canvas' active-edit mask.
    bool isMaskable() const;

    bool isInteractive() const { return m_interactive; }
    void setInteractive(bool interactive) { m_interactive = interactive; }

    // ===== Geometry =====

    /// Untransformed sprite bounds (document coordinates).
    const QRectF& bounds() const { return m_bounds; }

    /**
     * @brief Bounds after the layer's scale and rotation.
     */
    QRectF actualBounds() const;

    /**
     * @brief Whether a document point lies within actualBounds().
     */
    bool insideBounds(qreal x, qreal y) const;

    /**
     * @brief Reset the sprite bounds to the layer geometry (no history).
     *
     * For changes made to the layer from outside; use setBounds() for
     * user driven moves.
     */
    void syncPosition();

    /**
     * @brief Move the sprite, moving the layer by the same delta.
     * @param width, height Zero keeps the current size.
     *
     * Enqueues a "spritePos_<layerId>" entry, coalesced while the sprite is dragged.
     */
    void setBounds(qreal x, qreal y, qreal width = 0, qreal height = 0);

    /**
     * @brief Set the bounds position without history (used on replay).
     */
    void restoreBoundsPosition(const QPointF& position);

    // ===== Brush & effects =====

    /**
     * @brief Rebuild the brush from a color and tool options, keeping its samples.
     */
    void cacheBrush(const QColor& color, const BrushOptions& options);

    /**
     * @brief Record a pointer sample and mark the brush down.
     */
    void storeBrushPointer(qreal x, qreal y);

    /**
     * @brief Request the layer's effect recompute (once per frame).
     */
    void cacheEffects();

    /**
     * @brief Invalidate the filter output and recompute after content changes.
     */
    void resetFilterAndRecache();

    /**
     * @brief The bitmap the sprite renders (cached composite or composed on the fly).
     */
    QImage bitmap() const;

    // ===== Tool handling =====

    void handleActiveLayer(const QString& activeLayerId);

    /**
     * @brief Snapshot the document selection into the sprite.
     * @param onlyWhenClosed Keep the selection only when it is closed (or the
     *        mask is painted) and the layer supports drawing on selections.
     */
    void setSelection(const Document& document, bool onlyWhenClosed = false);
    void resetSelection();
    const QVector<QPointF>& selection() const { return m_selection; }
    bool invertSelection() const { return m_invertSelection; }

    /**
     * @brief Arm a tool.
     *
     * Finishes an in-flight stroke and commits pending snapshots first.
     * Non-interactive sprites only reset their state.
     */
    void handleActiveTool(ToolType tool, const BrushOptions& options, const Document& document);

    /**
     * @brief Keep following the cursor without a drag (brush outline).
     */
    void forceMoveListener();
    bool isMoveListening() const { return m_moveListening; }

    // ===== Painting =====

    /**
     * @brief The stroke-paint procedure.
     * @param action Optional one-off action replacing the tool dispatch.
     */
    void paint(const PaintAction* action = nullptr);

    /**
     * @brief Outline the document selection on the destination raster.
     * @param size Line width in on-screen pixels.
     */
    void strokeSelection(const QColor& color, qreal size = 1.0);

    // ===== Snapshot debounce =====

    /**
     * @brief Capture the "before" snapshot and arm the delayed commit.
     */
    void preparePendingPaintState();

    void debouncePaintStore(int timeoutMs);

    /**
     * @brief Commit the pending snapshot as a "spritePaint_<layerId>" entry.
     * @return True if nothing was pending or the commit completed, false if it
     *         was re-armed (brush still down) or skipped.
     */
    bool storePaintState();

    bool hasPendingPaintState() const { return m_commitTask != 0; }

    // ===== Pointer input (document coordinates) =====

    void handlePress(qreal x, qreal y, PointerKind kind = PointerKind::Mouse);
    void handleMove(qreal x, qreal y, PointerKind kind = PointerKind::Mouse);
    void handleRelease(qreal x, qreal y);

    /**
     * @brief Per frame step: paints once while the brush is down.
     */
    void update();

    const QPointF& pointer() const { return m_pointer; }
    bool hasPreview() const { return m_preview != nullptr; }

    // ===== Rendering =====

    /**
     * @brief Draw the layer, the live preview and the tool outline.
     * @param painter Painter in document coordinates.
     * @param viewport Visible area, the sprite skips drawing outside it.
     */
    void draw(QPainter& painter, const QRectF& viewport, bool omitOutlines = false);

    /**
     * @brief Cancel scheduled work without committing and release buffers.
     */
    void dispose();

signals:
    void colorPicked(const QColor& color);

    /// Emitted after each paint() pass.
    void paintApplied(bool preview);

    void repaintRequested();

private:
    QImage& destinationBuffer(bool drawOnMask) const;
    QPointF destinationOffset(bool drawOnMask) const;

    /// Document points -> destination raster coordinates.
    QVector<QPointF> toDestinationSpace(const QVector<QPointF>& points, bool drawOnMask) const;

    /// Like toDestinationSpace(), but for a painter flipped with the layer's mirror flags.
    QVector<QPointF> toMirroredDestinationSpace(const QVector<QPointF>& points, bool drawOnMask) const;

    void renderClone(QPainter& painter, const QImage& sourcePixels, const Layer& sourceLayer,
                     const QVector<QPointF>& pointers, bool drawOnMask);
    void renderFullResolutionStroke(QPainter& painter, const QImage& destination, bool drawOnMask);

    /// Release step of a stroke: full resolution pass of the whole path.
    void finishStroke();

    /// Commit the pending snapshot regardless of the brush state.
    bool commitPendingPaintState();

    void resetInteractionState();
    void invalidate() { emit repaintRequested(); }

    Layer* m_layer = nullptr;
    PaintCanvas& m_canvas;
    QString m_layerId;

    bool m_interactive = true;
    bool m_disposed = false;
    ActionTarget m_actionTarget = ActionTarget::Source;
    QRectF m_bounds;

    // Tool state
    ToolType m_toolType = ToolType::None;
    BrushOptions m_toolOptions;
    bool m_paintMode = false;
    bool m_dragMode = false;
    bool m_colorPicker = false;
    bool m_moveListening = false;

    Brush m_brush;
    QPointF m_pointer;
    QVector<QPointF> m_selection;
    bool m_invertSelection = false;

    // Clone destination anchor (the source anchor lives in m_toolOptions)
    QPointF m_cloneStart;
    bool m_hasCloneStart = false;

    // Drag anchors
    bool m_dragging = false;
    bool m_maskDragging = false;
    QPointF m_dragEventStart;
    QPointF m_dragBoundsStart;
    QPointF m_maskDragStart;

    std::unique_ptr<LowResPreview> m_preview;

    // Pending snapshot commit
    std::shared_ptr<const PaintSnapshot> m_pendingBefore;
    bool m_pendingOnMask = false;
    Scheduler::TaskId m_commitTask = 0;
};
