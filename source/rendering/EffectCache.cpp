#include "EffectCache.h"
#include "EffectRenderer.h"

#include <QDebug>

EffectCache::EffectCache(Scheduler& scheduler)
    : m_scheduler(scheduler)
{
}

EffectCache::~EffectCache()
{
    for (auto it = m_entries.begin(); it != m_entries.end(); ++it) {
        if (it->inFlight) {
            m_scheduler.cancelFrame(it->frameTask);
        }
    }
}

bool EffectCache::isValid(const QString& layerId, Property property) const
{
    auto it = m_entries.constFind(layerId);
    if (it == m_entries.constEnd()) {
        return false;
    }
    switch (property) {
        case Property::Filters:
            return it->filtersValid;
        case Property::Bitmap:
            return it->bitmapValid;
    }
    return false;
}

QImage EffectCache::bitmap(const QString& layerId) const
{
    auto it = m_entries.constFind(layerId);
    return it == m_entries.constEnd() ? QImage() : it->bitmap;
}

LayerFilters EffectCache::filterData(const QString& layerId) const
{
    auto it = m_entries.constFind(layerId);
    return it == m_entries.constEnd() ? LayerFilters() : it->filterData;
}

void EffectCache::store(const QString& layerId, const QImage& bitmap, const LayerFilters& filters)
{
    Entry& entry = m_entries[layerId];
    entry.bitmap = bitmap;
    entry.filterData = filters;
    entry.filtersValid = true;
    entry.bitmapValid = true;
}

void EffectCache::invalidate(const QString& layerId, Property property)
{
    Entry& entry = m_entries[layerId];
    switch (property) {
        case Property::Filters:
            // the composite includes the filter output
            entry.filtersValid = false;
            entry.bitmapValid = false;
            break;
        case Property::Bitmap:
            entry.bitmapValid = false;
            break;
    }
}

void EffectCache::flushLayer(const QString& layerId)
{
    cancelRecompute(layerId);
    m_entries.remove(layerId);
}

bool EffectCache::requestRecompute(const QString& layerId)
{
    Entry& entry = m_entries[layerId];
    if (entry.inFlight) {
        return false;
    }
    entry.inFlight = true;
    entry.frameTask = m_scheduler.requestFrame([this, layerId]() {
        runRecompute(layerId);
    });
    return true;
}

void EffectCache::cancelRecompute(const QString& layerId)
{
    auto it = m_entries.find(layerId);
    if (it == m_entries.end() || !it->inFlight) {
        return;
    }
    m_scheduler.cancelFrame(it->frameTask);
    it->frameTask = 0;
    it->inFlight = false;
}

bool EffectCache::isRecomputePending(const QString& layerId) const
{
    auto it = m_entries.constFind(layerId);
    return it != m_entries.constEnd() && it->inFlight;
}

void EffectCache::runRecompute(const QString& layerId)
{
    Layer* layer = m_resolver ? m_resolver(layerId) : nullptr;
    if (layer && m_renderer) {
        m_renderer->renderEffects(*layer, true);
    } else if (!layer) {
        qDebug() << "EffectCache::runRecompute: layer" << layerId << "no longer exists";
    }

    // The entry may have been flushed by the renderer's caller in the meantime
    auto it = m_entries.find(layerId);
    if (it != m_entries.end()) {
        it->inFlight = false;
        it->frameTask = 0;
    }
}
