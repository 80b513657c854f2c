#pragma once

// ============================================================================
// PaintCanvas - Shared editing context of the layer sprites
// ============================================================================
// PaintCanvas ties a Document to the services its sprites paint through:
// - UndoHistory (paint, position and mask entries)
// - EffectCache + EffectRenderer (per layer composite bitmaps)
// - SpriteRegistry (one live LayerSprite per layer)
// - Scheduler (frame callbacks and snapshot debounce timers)
//
// It also holds the view state sprites need while painting: the visible
// viewport, the zoom factor, the active color and the dragging sprite.
//
// The Document is not owned. The Scheduler is not owned and must outlive
// the canvas.
// ============================================================================

#include "Document.h"
#include "Preferences.h"
#include "Scheduler.h"
#include "SpriteRegistry.h"
#include "UndoHistory.h"
#include "../rendering/EffectCache.h"
#include "../rendering/EffectRenderer.h"

#include <QObject>
#include <QColor>
#include <QRectF>
#include <memory>

class QPainter;
class LayerSprite;

class PaintCanvas : public QObject {
    Q_OBJECT

public:
    PaintCanvas(Document* document, Scheduler& scheduler,
                const Preferences& preferences = Preferences(), QObject* parent = nullptr);
    ~PaintCanvas() override;

    // ===== Services =====

    Document* document() const { return m_document; }
    Scheduler& scheduler() { return m_scheduler; }
    UndoHistory& history() { return m_history; }
    EffectCache& effectCache() { return m_effectCache; }
    EffectRenderer& effectRenderer() { return *m_effectRenderer; }
    SpriteRegistry& sprites() { return m_sprites; }

    /**
     * @brief Replace the effect renderer (the default applies mask and filters).
     */
    void setEffectRenderer(std::unique_ptr<EffectRenderer> renderer);

    const Preferences& preferences() const { return m_preferences; }
    void setPreferences(const Preferences& preferences);

    // ===== View state =====

    /// Visible area in document coordinates.
    const QRectF& viewport() const { return m_viewport; }
    void setViewport(const QRectF& viewport) { m_viewport = viewport; }

    /// On-screen pixels per document pixel.
    qreal zoomFactor() const { return m_zoomFactor; }
    void setZoomFactor(qreal zoom);

    /// Document pixels per on-screen pixel (inverse of the zoom).
    qreal documentScale() const { return 1.0 / m_zoomFactor; }

    const QColor& activeColor() const { return m_activeColor; }
    void setActiveColor(const QColor& color);

    LayerSprite* draggingSprite() const { return m_draggingSprite; }
    void setDraggingSprite(LayerSprite* sprite) { m_draggingSprite = sprite; }

    /**
     * @brief Layer whose mask is being edited (empty = none).
     *
     * Sprites only paint into a mask that is the active-edit mask.
     */
    const QString& maskEditLayerId() const { return m_maskEditLayerId; }
    void setMaskEditLayer(const QString& layerId) { m_maskEditLayerId = layerId; }

    // ===== Sprites =====

    /**
     * @brief Create (or recreate) the sprite of a document layer.
     * @return nullptr if the document has no such layer.
     */
    LayerSprite* createSprite(const QString& layerId);

    /**
     * @brief Mark the given layer as the one receiving tool input.
     */
    void setActiveLayer(const QString& layerId);

    // ===== Frame =====

    /**
     * @brief One display frame: sprite updates, then queued frame callbacks
     * (effect recomputes).
     */
    void renderFrame();

    /**
     * @brief Draw all visible layers bottom to top (document coordinates).
     */
    void render(QPainter& painter, bool omitOutlines = false);

    // ===== Document utilities =====

    /**
     * @brief Composite color of all visible layers at a document point.
     */
    QColor colorAt(const QPointF& point) const;

    /**
     * @brief Dispose the layer's sprite and remove the layer.
     */
    bool removeLayer(const QString& layerId);

    /**
     * @brief The layer bitmap to draw: the cached composite when valid,
     * otherwise composed on the fly.
     */
    QImage layerBitmap(const Layer& layer) const;

    /**
     * @brief Draw a layer bitmap with the layer transform and filter opacity.
     */
    static void drawLayer(QPainter& painter, const Layer& layer, const QImage& bitmap);

signals:
    void activeColorChanged(const QColor& color);

private:
    Document* m_document = nullptr;
    Scheduler& m_scheduler;
    Preferences m_preferences;

    UndoHistory m_history;
    EffectCache m_effectCache;
    std::unique_ptr<EffectRenderer> m_effectRenderer;
    SpriteRegistry m_sprites;           ///< Declared last: sprites use the services above

    QRectF m_viewport;
    qreal m_zoomFactor = 1.0;
    QColor m_activeColor = QColor(255, 0, 0);
    LayerSprite* m_draggingSprite = nullptr;
    QString m_maskEditLayerId;
};
