#pragma once

// ============================================================================
// Layer - A positioned, transformable raster surface within a Document
// ============================================================================
// Layer is a pure data class. All input handling and rendering optimizations
// live in LayerSprite, which is created per layer by the SpriteRegistry.
// ============================================================================

#include <QString>
#include <QImage>
#include <QRectF>
#include <QSize>

/**
 * @brief Kinds of layers. Only graphic layers (and masks) are drawable.
 */
enum class LayerType {
    Graphic,    ///< Free drawing surface
    Text,       ///< Rendered text, source raster owned by the layer
    Image       ///< Created from an imported bitmap
};

/**
 * @brief Geometric effects applied when the layer is rendered.
 */
struct LayerEffects {
    qreal rotation = 0.0;   ///< Rotation in degrees, clockwise around the layer center
    qreal scale = 1.0;      ///< Uniform scale around the layer center
    bool mirrorX = false;   ///< Flip horizontally
    bool mirrorY = false;   ///< Flip vertically
};

/**
 * @brief Pixel filters applied to the cached layer bitmap.
 */
struct LayerFilters {
    bool enabled = false;
    qreal opacity = 1.0;    ///< Render opacity (applied while drawing, not baked)
    bool desaturate = false;
    bool invert = false;
};

/**
 * @brief A named raster drawing surface.
 *
 * The source raster holds the pixel content, the optional mask raster
 * controls visibility of the source (opaque mask = visible) and is offset
 * by maskX/maskY relative to the layer origin.
 */
class Layer {
public:
    // ===== Identity =====
    QString id;                         ///< UUID for tracking (registry and history keys)
    QString name = "Layer";
    LayerType type = LayerType::Graphic;
    bool visible = true;

    // ===== Geometry (document coordinates, untransformed) =====
    qreal left = 0.0;
    qreal top = 0.0;
    int width = 0;
    int height = 0;

    // ===== Content =====
    QImage source;                      ///< Primary pixel buffer
    QImage mask;                        ///< Optional mask buffer (null when absent)
    qreal maskX = 0.0;
    qreal maskY = 0.0;

    LayerEffects effects;
    LayerFilters filters;

    /// Pixel format used for all layer rasters.
    static constexpr QImage::Format RASTER_FORMAT = QImage::Format_ARGB32_Premultiplied;

    Layer();
    Layer(const QString& layerName, LayerType layerType, int layerWidth, int layerHeight);

    /**
     * @brief Create a layer from an existing bitmap (LayerType::Image).
     */
    static Layer fromImage(const QString& layerName, const QImage& image);

    bool hasMask() const { return !mask.isNull(); }

    /**
     * @brief Allocate a transparent source raster if the layer has none.
     * @return True if a raster was allocated.
     */
    bool ensureSource();

    /**
     * @brief Allocate a fully opaque mask raster of the layer size.
     */
    void createMask();

    void removeMask();

    QRectF bounds() const { return QRectF(left, top, width, height); }
    QSize size() const { return QSize(width, height); }

    bool isRotated() const;
    bool isScaled() const;

    /**
     * @brief Allocate a transparent raster in the layer pixel format.
     */
    static QImage createRaster(int rasterWidth, int rasterHeight);
};
