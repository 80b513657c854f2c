#pragma once

// ============================================================================
// UndoHistory - Linear undo/redo stack of closure based entries
// ============================================================================
// Entries are built by the paint core (LayerSprite, PaintCanvas). Their
// closures must only restore or re-apply what they captured: they are replayed
// any number of times. Closures resolve live objects (sprites, layers) by id
// at replay time, never through captured pointers to transient objects.
//
// Snapshot resources are owned by the entries. Dropping an entry (redo
// truncation, depth eviction, clear) releases its references.
// ============================================================================

#include "PaintSnapshot.h"

#include <QObject>
#include <QStack>
#include <QString>
#include <QVector>
#include <functional>
#include <memory>

struct HistoryEntry {
    QString key;                        ///< Scope of the entry, e.g. "spritePaint_<layerId>"
    std::function<void()> undo;
    std::function<void()> redo;
    QVector<std::shared_ptr<const PaintSnapshot>> resources;
};

class UndoHistory : public QObject {
    Q_OBJECT

public:
    static constexpr int DEFAULT_MAX_DEPTH = 100;

    explicit UndoHistory(QObject* parent = nullptr);

    /**
     * @brief Push an entry, dropping every redo-able entry.
     * @param key Entry scope.
     * @param entry Closures and resources.
     * @param coalesce When the top entry has the same key and is still open
     *        (not sealed), merge into it instead: its undo is kept, its redo is
     *        replaced. Used for continuous operations such as drags.
     */
    void enqueue(const QString& key, HistoryEntry entry, bool coalesce = false);

    /**
     * @brief Close the top entry for coalescing (e.g. at the end of a drag).
     */
    void seal() { m_openKey.clear(); }

    bool undo();
    bool redo();

    bool canUndo() const { return !m_undoStack.isEmpty(); }
    bool canRedo() const { return !m_redoStack.isEmpty(); }
    int undoCount() const { return m_undoStack.size(); }
    int redoCount() const { return m_redoStack.size(); }

    /// Key of the entry the next undo() replays (empty if none).
    QString peekUndoKey() const { return canUndo() ? m_undoStack.top().key : QString(); }

    void clear();

    int maxDepth() const { return m_maxDepth; }
    void setMaxDepth(int depth);

signals:
    void undoAvailableChanged(bool available);
    void redoAvailableChanged(bool available);

    /// Emitted after an entry was enqueued, undone or redone.
    void historyChanged();

private:
    void trimUndoStack();
    void clearRedoStack();

    QStack<HistoryEntry> m_undoStack;
    QStack<HistoryEntry> m_redoStack;
    QString m_openKey;                  ///< Key of the open (coalescable) top entry
    int m_maxDepth = DEFAULT_MAX_DEPTH;
};
