#pragma once

// ============================================================================
// UndoHistoryTests - History stack, snapshots, scheduler and preferences
// ============================================================================
// Run with: brushwork --test-history
// ============================================================================

#include <QObject>
#include <QTest>
#include <QSignalSpy>
#include <QRegularExpression>
#include <QSettings>
#include <QTemporaryDir>

#include "UndoHistory.h"
#include "PaintSnapshot.h"
#include "Preferences.h"
#include "Scheduler.h"
#include "Layer.h"

class UndoHistoryTests : public QObject {
    Q_OBJECT

private:
    static QImage patternImage(int width, int height) {
        QImage image(width, height, Layer::RASTER_FORMAT);
        for (int y = 0; y < height; ++y) {
            for (int x = 0; x < width; ++x) {
                image.setPixel(x, y, qRgba(x % 256, y % 256, (x * y) % 256, 255));
            }
        }
        return image;
    }

    static HistoryEntry valueEntry(int& target, int undoValue, int redoValue) {
        HistoryEntry entry;
        entry.undo = [&target, undoValue]() { target = undoValue; };
        entry.redo = [&target, redoValue]() { target = redoValue; };
        return entry;
    }

private slots:
    // ===== PaintSnapshot =====

    void testSnapshotRoundTrip() {
        const QImage original = patternImage(37, 23);
        auto snapshot = PaintSnapshot::capture(original);
        QVERIFY(snapshot != nullptr);
        QCOMPARE(snapshot->size(), QSize(37, 23));

        const QImage decoded = snapshot->decode();
        QCOMPARE(decoded.format(), original.format());
        QVERIFY(decoded == original);

        QImage target(5, 5, Layer::RASTER_FORMAT);
        QVERIFY(snapshot->restoreInto(target));
        QVERIFY(target == original);
    }

    void testSnapshotOfNullImageFails() {
        QTest::ignoreMessage(QtWarningMsg, QRegularExpression("PaintSnapshot::capture"));
        QVERIFY(PaintSnapshot::capture(QImage()) == nullptr);
    }

    // ===== UndoHistory =====

    void testUndoRedo() {
        UndoHistory history;
        int value = 0;

        value = 1;
        history.enqueue("a", valueEntry(value, 0, 1));
        value = 2;
        history.enqueue("b", valueEntry(value, 1, 2));

        QCOMPARE(history.undoCount(), 2);
        QVERIFY(history.undo());
        QCOMPARE(value, 1);
        QVERIFY(history.undo());
        QCOMPARE(value, 0);
        QVERIFY(!history.undo());

        QVERIFY(history.redo());
        QVERIFY(history.redo());
        QCOMPARE(value, 2);
        QVERIFY(!history.redo());
    }

    void testAvailabilitySignals() {
        UndoHistory history;
        QSignalSpy undoSpy(&history, &UndoHistory::undoAvailableChanged);
        QSignalSpy redoSpy(&history, &UndoHistory::redoAvailableChanged);
        int value = 0;

        history.enqueue("a", valueEntry(value, 0, 1));
        QCOMPARE(undoSpy.count(), 1);
        QCOMPARE(undoSpy.takeFirst().at(0).toBool(), true);

        history.undo();
        QVERIFY(!history.canUndo());
        QVERIFY(history.canRedo());
        QCOMPARE(redoSpy.last().at(0).toBool(), true);
    }

    void testTruncationReleasesResources() {
        UndoHistory history;
        int value = 0;

        std::weak_ptr<const PaintSnapshot> released;
        {
            HistoryEntry entry = valueEntry(value, 0, 1);
            auto snapshot = PaintSnapshot::capture(patternImage(8, 8));
            released = snapshot;
            entry.resources.append(snapshot);
            history.enqueue("paint", std::move(entry));
        }
        QVERIFY(!released.expired());

        // undone entries stay alive on the redo stack
        history.undo();
        QVERIFY(!released.expired());

        // a new action drops everything redo-able
        history.enqueue("other", valueEntry(value, 0, 2));
        QVERIFY(released.expired());
        QVERIFY(!history.canRedo());
    }

    void testDepthEviction() {
        UndoHistory history;
        history.setMaxDepth(3);
        int value = 0;

        QVector<std::weak_ptr<const PaintSnapshot>> resources;
        for (int i = 0; i < 5; ++i) {
            HistoryEntry entry = valueEntry(value, i, i + 1);
            auto snapshot = PaintSnapshot::capture(patternImage(4, 4));
            resources.append(snapshot);
            entry.resources.append(snapshot);
            history.enqueue(QString("entry%1").arg(i), std::move(entry));
        }

        QCOMPARE(history.undoCount(), 3);
        QVERIFY(resources[0].expired());
        QVERIFY(resources[1].expired());
        QVERIFY(!resources[2].expired());
        QVERIFY(!resources[4].expired());
        QCOMPARE(history.peekUndoKey(), QString("entry4"));
    }

    void testCoalescing() {
        UndoHistory history;
        int value = 0;

        history.enqueue("drag", valueEntry(value, 0, 1), true);
        history.enqueue("drag", valueEntry(value, 1, 2), true);
        history.enqueue("drag", valueEntry(value, 2, 3), true);
        value = 3;
        QCOMPARE(history.undoCount(), 1);

        // the first undo and the last redo survive
        history.undo();
        QCOMPARE(value, 0);
        history.redo();
        QCOMPARE(value, 3);

        // sealed (by the undo/redo above): a new drag is a new entry
        history.enqueue("drag", valueEntry(value, 3, 4), true);
        QCOMPARE(history.undoCount(), 2);

        history.seal();
        history.enqueue("drag", valueEntry(value, 4, 5), true);
        QCOMPARE(history.undoCount(), 3);

        // different keys never merge
        history.enqueue("other", valueEntry(value, 5, 6), true);
        QCOMPARE(history.undoCount(), 4);
    }

    void testClear() {
        UndoHistory history;
        int value = 0;
        history.enqueue("a", valueEntry(value, 0, 1));
        history.enqueue("b", valueEntry(value, 1, 2));
        history.undo();

        history.clear();
        QVERIFY(!history.canUndo());
        QVERIFY(!history.canRedo());
    }

    // ===== Scheduler =====

    void testManualSchedulerOrder() {
        ManualScheduler scheduler;
        QStringList order;

        scheduler.schedule(300, [&order]() { order << "c"; });
        scheduler.schedule(100, [&order]() { order << "a"; });
        const Scheduler::TaskId cancelled = scheduler.schedule(200, [&order]() { order << "x"; });
        scheduler.schedule(200, [&order, &scheduler]() {
            order << "b";
            // scheduled from a task, due within the same advance()
            scheduler.schedule(50, [&order]() { order << "b2"; });
        });

        QVERIFY(scheduler.isPending(cancelled));
        QVERIFY(scheduler.cancel(cancelled));
        QVERIFY(!scheduler.cancel(cancelled));

        scheduler.advance(150);
        QCOMPARE(order, QStringList({ "a" }));
        QCOMPARE(scheduler.now(), qint64(150));

        scheduler.advance(1000);
        QCOMPARE(order, QStringList({ "a", "b", "b2", "c" }));
        QCOMPARE(scheduler.pendingCount(), 0);
    }

    void testFrameCallbacks() {
        ManualScheduler scheduler;
        int runs = 0;

        scheduler.requestFrame([&runs, &scheduler]() {
            ++runs;
            // requested during a frame: runs on the next one
            scheduler.requestFrame([&runs]() { runs += 10; });
        });
        const Scheduler::TaskId cancelled = scheduler.requestFrame([&runs]() { runs += 100; });
        QVERIFY(scheduler.cancelFrame(cancelled));

        QCOMPARE(scheduler.runFrame(), 1);
        QCOMPARE(runs, 1);
        QCOMPARE(scheduler.runFrame(), 1);
        QCOMPARE(runs, 11);
        QCOMPARE(scheduler.runFrame(), 0);
    }

    void testTimerScheduler() {
        TimerScheduler scheduler;
        int runs = 0;

        const Scheduler::TaskId id = scheduler.schedule(10, [&runs]() { ++runs; });
        const Scheduler::TaskId cancelled = scheduler.schedule(10, [&runs]() { runs += 100; });
        QVERIFY(scheduler.isPending(id));
        QVERIFY(scheduler.cancel(cancelled));
        QVERIFY(!scheduler.cancel(cancelled));

        QTRY_COMPARE(runs, 1);
        QVERIFY(!scheduler.isPending(id));
        QTest::qWait(30);
        QCOMPARE(runs, 1);
    }

    // ===== Preferences =====

    void testPreferencesDefaults() {
        QTemporaryDir dir;
        QVERIFY(dir.isValid());
        QSettings settings(dir.filePath("preferences.ini"), QSettings::IniFormat);

        const Preferences prefs = Preferences::load(settings);
        QCOMPARE(prefs.lowMemory, false);
        QCOMPARE(prefs.snapAlign, false);
        QCOMPARE(prefs.antiAlias, true);
        QCOMPARE(prefs.paintCommitDelay, 5000);
        QCOMPARE(prefs.paintRecommitDelay, 1000);
        QCOMPARE(prefs.maxUndoDepth, 100);
        QCOMPARE(prefs.snapMargin, 10);
    }

    void testPreferencesSaveLoad() {
        QTemporaryDir dir;
        QVERIFY(dir.isValid());
        const QString path = dir.filePath("preferences.ini");

        Preferences prefs;
        prefs.lowMemory = true;
        prefs.snapAlign = true;
        prefs.paintCommitDelay = 2500;
        prefs.maxUndoDepth = 20;
        {
            QSettings settings(path, QSettings::IniFormat);
            prefs.save(settings);
        }

        QSettings settings(path, QSettings::IniFormat);
        QCOMPARE(settings.value("preferences/paintCommitDelay").toInt(), 2500);

        const Preferences loaded = Preferences::load(settings);
        QCOMPARE(loaded.lowMemory, true);
        QCOMPARE(loaded.snapAlign, true);
        QCOMPARE(loaded.paintCommitDelay, 2500);
        QCOMPARE(loaded.paintRecommitDelay, 1000);
        QCOMPARE(loaded.maxUndoDepth, 20);
    }
};
