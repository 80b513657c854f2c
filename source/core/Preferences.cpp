#include "Preferences.h"

#include <QSettings>

const QString Preferences::SETTINGS_GROUP = QStringLiteral("preferences");

namespace {
const char* KEY_LOW_MEMORY = "lowMemory";
const char* KEY_SNAP_ALIGN = "snapAlign";
const char* KEY_ANTI_ALIAS = "antiAlias";
const char* KEY_PAINT_COMMIT_DELAY = "paintCommitDelay";
const char* KEY_PAINT_RECOMMIT_DELAY = "paintRecommitDelay";
const char* KEY_MAX_UNDO_DEPTH = "maxUndoDepth";
const char* KEY_SNAP_MARGIN = "snapMargin";
}

Preferences Preferences::load(QSettings& settings)
{
    Preferences defaults;
    Preferences prefs;

    settings.beginGroup(SETTINGS_GROUP);
    prefs.lowMemory = settings.value(KEY_LOW_MEMORY, defaults.lowMemory).toBool();
    prefs.snapAlign = settings.value(KEY_SNAP_ALIGN, defaults.snapAlign).toBool();
    prefs.antiAlias = settings.value(KEY_ANTI_ALIAS, defaults.antiAlias).toBool();
    prefs.paintCommitDelay = qMax(0, settings.value(KEY_PAINT_COMMIT_DELAY, defaults.paintCommitDelay).toInt());
    prefs.paintRecommitDelay = qMax(0, settings.value(KEY_PAINT_RECOMMIT_DELAY, defaults.paintRecommitDelay).toInt());
    prefs.maxUndoDepth = qMax(1, settings.value(KEY_MAX_UNDO_DEPTH, defaults.maxUndoDepth).toInt());
    prefs.snapMargin = qMax(0, settings.value(KEY_SNAP_MARGIN, defaults.snapMargin).toInt());
    settings.endGroup();

    return prefs;
}

Preferences Preferences::load()
{
    QSettings settings;
    return load(settings);
}

void Preferences::save(QSettings& settings) const
{
    settings.beginGroup(SETTINGS_GROUP);
    settings.setValue(KEY_LOW_MEMORY, lowMemory);
    settings.setValue(KEY_SNAP_ALIGN, snapAlign);
    settings.setValue(KEY_ANTI_ALIAS, antiAlias);
    settings.setValue(KEY_PAINT_COMMIT_DELAY, paintCommitDelay);
    settings.setValue(KEY_PAINT_RECOMMIT_DELAY, paintRecommitDelay);
    settings.setValue(KEY_MAX_UNDO_DEPTH, maxUndoDepth);
    settings.setValue(KEY_SNAP_MARGIN, snapMargin);
    settings.endGroup();
}

void Preferences::save() const
{
    QSettings settings;
    save(settings);
}
