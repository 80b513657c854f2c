#pragma once

// ============================================================================
// Document - An image composed of an ordered stack of layers
// ============================================================================
// Document owns:
// - All Layers (index 0 = bottom of the z-order)
// - The canvas size
// - The current selection polygon and its invert flag
//
// Document is a pure data class - rendering and input are handled by the
// PaintCanvas and the LayerSprites it creates for each layer.
// ============================================================================

#include "Layer.h"

#include <QString>
#include <QVector>
#include <QPointF>
#include <QRectF>
#include <QImage>
#include <vector>
#include <memory>

/**
 * @brief The central data structure representing an open image.
 */
class Document {
public:
    // ===== Identity =====
    QString id;                         ///< UUID for tracking
    QString name;                       ///< Display name

    // ===== Canvas =====
    int width = 0;
    int height = 0;

    // ===== Constructors & Rule of Five =====

    Document();
    Document(const QString& docName, int docWidth, int docHeight);
    ~Document() = default;

    // Document is non-copyable due to unique_ptr members
    Document(const Document&) = delete;
    Document& operator=(const Document&) = delete;

    Document(Document&&) = default;
    Document& operator=(Document&&) = default;

    /**
     * @brief Create a new document with one empty graphic layer.
     */
    static std::unique_ptr<Document> createNew(const QString& docName, int docWidth, int docHeight);

    QString displayName() const { return name.isEmpty() ? QStringLiteral("Untitled") : name; }

    // ===== Layer Management =====

    int layerCount() const { return static_cast<int>(m_layers.size()); }

    Layer* layer(int index);
    const Layer* layer(int index) const;

    /**
     * @brief Find a layer by its id.
     * @return The layer, or nullptr if no layer with that id exists.
     */
    Layer* layerById(const QString& layerId);
    const Layer* layerById(const QString& layerId) const;

    int indexOf(const QString& layerId) const;

    /**
     * @brief Append a layer at the top of the stack.
     * @return Non-owning pointer to the added layer.
     */
    Layer* addLayer(std::unique_ptr<Layer> layer);

    /**
     * @brief Create and append an empty graphic layer covering the canvas.
     */
    Layer* addLayer(const QString& layerName);

    /**
     * @brief Remove a layer, releasing its rasters.
     * @return True if the layer existed.
     *
     * Callers with a live sprite for the layer should go through
     * PaintCanvas::removeLayer() so the sprite is disposed first.
     */
    bool removeLayer(const QString& layerId);

    bool moveLayer(int from, int to);

    const std::vector<std::unique_ptr<Layer>>& layers() const { return m_layers; }

    // ===== Selection =====

    const QVector<QPointF>& selection() const { return m_selection; }
    bool invertSelection() const { return m_invertSelection; }
    bool hasSelection() const { return !m_selection.isEmpty(); }

    /**
     * @brief Replace the selection polygon.
     *
     * Polygons with fewer than three points cannot enclose an area and are
     * stored as "no selection".
     */
    void setSelection(const QVector<QPointF>& points, bool invert = false);
    void setInvertSelection(bool invert) { m_invertSelection = invert; }
    void clearSelection();

    // ===== Utilities =====

    /**
     * @brief Guide lines elements can be aligned to.
     * @param excludeLayerId Optional layer to leave out (usually the one being dragged).
     * @return Zero-height (horizontal) and zero-width (vertical) rectangles.
     *
     * Includes the document center lines and, for every visible layer that does
     * not cover the whole document, its (rotated) top/center/bottom and
     * left/center/right edges.
     */
    QVector<QRectF> alignableGuides(const QString& excludeLayerId = QString()) const;

    /**
     * @brief Copy of the layer's editable raster with the selected pixels removed.
     * @return The layer mask (or source when it has no mask) with the selection
     *         area cleared, or the complement of it when the selection is inverted.
     *         Returns a plain copy when there is no usable selection.
     */
    QImage eraseSelectionContent(const Layer& layer) const;

    /**
     * @brief Copy the selected pixels into a separate image.
     * @param layer Layer to copy from, rendered with its transform, mask and filters.
     * @param merged Copy the composite of all visible layers instead.
     * @return Image the size of the selection bounding box (the whole document
     *         when the selection is inverted), pixels outside the selection are
     *         transparent. A null image when there is no usable selection.
     */
    QImage copySelection(const Layer& layer, bool merged = false) const;

private:
    std::vector<std::unique_ptr<Layer>> m_layers;   ///< Layers (index 0 = bottom)
    QVector<QPointF> m_selection;                   ///< Closed polygon or empty
    bool m_invertSelection = false;
};
