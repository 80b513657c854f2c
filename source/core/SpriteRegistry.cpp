#include "SpriteRegistry.h"
#include "Layer.h"
#include "../viewport/LayerSprite.h"

SpriteRegistry::~SpriteRegistry()
{
    clear();
}

LayerSprite* SpriteRegistry::createSpriteForLayer(Layer& layer, PaintCanvas& canvas)
{
    disposeSpriteForLayer(layer.id);

    auto sprite = std::make_unique<LayerSprite>(layer, canvas);
    LayerSprite* result = sprite.get();
    m_sprites[layer.id] = std::move(sprite);
    return result;
}

LayerSprite* SpriteRegistry::getSpriteForLayer(const QString& layerId) const
{
    auto it = m_sprites.find(layerId);
    return it == m_sprites.end() ? nullptr : it->second.get();
}

bool SpriteRegistry::disposeSpriteForLayer(const QString& layerId)
{
    auto it = m_sprites.find(layerId);
    if (it == m_sprites.end()) {
        return false;
    }
    // Take ownership first so lookups during dispose() no longer find it
    std::unique_ptr<LayerSprite> sprite = std::move(it->second);
    m_sprites.erase(it);
    sprite->dispose();
    return true;
}

bool SpriteRegistry::runSpriteFn(const QString& layerId, const std::function<void(LayerSprite&)>& fn) const
{
    LayerSprite* sprite = getSpriteForLayer(layerId);
    if (!sprite) {
        return false;
    }
    fn(*sprite);
    return true;
}

void SpriteRegistry::forEach(const std::function<void(LayerSprite&)>& fn) const
{
    for (const auto& entry : m_sprites) {
        fn(*entry.second);
    }
}

void SpriteRegistry::clear()
{
    while (!m_sprites.empty()) {
        disposeSpriteForLayer(m_sprites.begin()->first);
    }
}
