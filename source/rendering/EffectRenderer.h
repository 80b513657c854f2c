#pragma once

// ============================================================================
// EffectRenderer - Renders a layer's effects into the EffectCache
// ============================================================================

#include <QImage>

class Layer;
class EffectCache;

/**
 * @brief Abstract effect rendering service.
 *
 * Implementations must be idempotent and only update the layer's cached
 * composite bitmap.
 */
class EffectRenderer {
public:
    virtual ~EffectRenderer() = default;

    /**
     * @brief Bring the layer's cached composite up to date.
     * @param useCache Skip rendering when the cached bitmap is still valid.
     */
    virtual void renderEffects(Layer& layer, bool useCache) = 0;
};

/**
 * @brief Default renderer: applies the layer mask and pixel filters.
 *
 * The filter opacity is not baked into the bitmap, it is applied when the
 * sprite draws the layer.
 */
class LayerEffectRenderer : public EffectRenderer {
public:
    explicit LayerEffectRenderer(EffectCache& cache);

    void renderEffects(Layer& layer, bool useCache) override;

    /// Number of renders actually performed (cache hits excluded).
    int renderCount() const { return m_renderCount; }

    /**
     * @brief Composite of source, mask and filters.
     */
    static QImage composite(const Layer& layer);

private:
    static void applyFilters(QImage& image, bool desaturate, bool invert);

    EffectCache& m_cache;
    int m_renderCount = 0;
};
