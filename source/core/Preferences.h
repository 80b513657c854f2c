#pragma once

// ============================================================================
// Preferences - Paint core settings
// ============================================================================
// Plain value type. Persisted through QSettings under the "preferences" group.
// ============================================================================

#include <QString>

class QSettings;

struct Preferences {
    bool lowMemory = false;             ///< Do not force the snapshot commit on stroke release
    bool snapAlign = false;             ///< Snap dragged sprites to guides on release
    bool antiAlias = true;
    int paintCommitDelay = 5000;        ///< ms until a stroke snapshot is committed
    int paintRecommitDelay = 1000;      ///< ms to wait again while the brush is still down
    int maxUndoDepth = 100;
    int snapMargin = 10;                ///< Guide snapping distance in document pixels

    static const QString SETTINGS_GROUP;

    /**
     * @brief Read preferences, missing keys keep their defaults.
     */
    static Preferences load(QSettings& settings);
    static Preferences load();

    void save(QSettings& settings) const;
    void save() const;
};
