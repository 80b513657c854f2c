#pragma once

// ============================================================================
// SpriteRegistry - The live LayerSprite of each layer
// ============================================================================
// History closures and other time-displaced callers look sprites up here by
// layer id instead of holding references: a sprite may be disposed and
// recreated between an action and its undo.
// ============================================================================

#include <QString>
#include <functional>
#include <map>
#include <memory>

class Layer;
class LayerSprite;
class PaintCanvas;

class SpriteRegistry {
public:
    SpriteRegistry() = default;
    ~SpriteRegistry();

    SpriteRegistry(const SpriteRegistry&) = delete;
    SpriteRegistry& operator=(const SpriteRegistry&) = delete;

    /**
     * @brief Create the sprite for a layer, disposing the previous one if any.
     * @return Non-owning pointer, valid until the sprite is disposed.
     */
    LayerSprite* createSpriteForLayer(Layer& layer, PaintCanvas& canvas);

    /**
     * @return The live sprite, or nullptr if the layer has none.
     */
    LayerSprite* getSpriteForLayer(const QString& layerId) const;

    /**
     * @brief Dispose and destroy the layer's sprite.
     * @return True if a sprite existed.
     */
    bool disposeSpriteForLayer(const QString& layerId);

    /**
     * @brief Invoke fn on the layer's sprite if it exists.
     * @return True if fn was invoked.
     */
    bool runSpriteFn(const QString& layerId, const std::function<void(LayerSprite&)>& fn) const;

    void forEach(const std::function<void(LayerSprite&)>& fn) const;

    int count() const { return static_cast<int>(m_sprites.size()); }

    /// Dispose all sprites.
    void clear();

private:
    std::map<QString, std::unique_ptr<LayerSprite>> m_sprites;
};
