#pragma once

// ============================================================================
// EffectCache - Per layer cache of the rendered effect output
// ============================================================================
// Every buffer or geometry mutation invalidates the layer's entry right away.
// The recompute itself is deferred to the next frame and coalesced: however
// many mutations happen within a frame, the effect renderer runs once per
// layer. An in-flight flag guards the scheduled recompute until it completes.
// ============================================================================

#include "../core/Scheduler.h"
#include "../core/Layer.h"

#include <QHash>
#include <QImage>
#include <QString>
#include <functional>

class EffectRenderer;

class EffectCache {
public:
    /**
     * @brief Cached properties of a layer.
     */
    enum class Property {
        Filters,    ///< Output of the pixel filters
        Bitmap      ///< Final composite (source, mask and filters)
    };

    using LayerResolver = std::function<Layer*(const QString& layerId)>;

    explicit EffectCache(Scheduler& scheduler);

    /// Withdraws every scheduled recompute: the scheduler may outlive the cache.
    ~EffectCache();

    EffectCache(const EffectCache&) = delete;
    EffectCache& operator=(const EffectCache&) = delete;

    void setRenderer(EffectRenderer* renderer) { m_renderer = renderer; }

    /**
     * @brief Resolves layer ids when a scheduled recompute runs.
     */
    void setLayerResolver(LayerResolver resolver) { m_resolver = std::move(resolver); }

    // ===== Cached data =====

    bool isValid(const QString& layerId, Property property) const;

    /// Cached composite, null if none was rendered yet.
    QImage bitmap(const QString& layerId) const;

    /// Filter parameters the cached output was rendered with.
    LayerFilters filterData(const QString& layerId) const;

    /**
     * @brief Store freshly rendered output, marking all properties valid.
     */
    void store(const QString& layerId, const QImage& bitmap, const LayerFilters& filters);

    void invalidate(const QString& layerId, Property property);

    /**
     * @brief Drop the layer's entry and any scheduled recompute.
     */
    void flushLayer(const QString& layerId);

    bool contains(const QString& layerId) const { return m_entries.contains(layerId); }

    // ===== Recompute =====

    /**
     * @brief Schedule the effect renderer for the layer on the next frame.
     * @return False if a recompute is already in flight for the layer.
     */
    bool requestRecompute(const QString& layerId);

    /**
     * @brief Withdraw a scheduled recompute (sprite disposal).
     */
    void cancelRecompute(const QString& layerId);

    bool isRecomputePending(const QString& layerId) const;

private:
    struct Entry {
        QImage bitmap;
        LayerFilters filterData;
        bool filtersValid = false;
        bool bitmapValid = false;
        bool inFlight = false;
        Scheduler::TaskId frameTask = 0;
    };

    void runRecompute(const QString& layerId);

    Scheduler& m_scheduler;
    EffectRenderer* m_renderer = nullptr;
    LayerResolver m_resolver;
    QHash<QString, Entry> m_entries;
};
