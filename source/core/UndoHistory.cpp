#include "UndoHistory.h"

#include <QDebug>

UndoHistory::UndoHistory(QObject* parent)
    : QObject(parent)
{
}

void UndoHistory::enqueue(const QString& key, HistoryEntry entry, bool coalesce)
{
    entry.key = key;

    if (coalesce && !m_openKey.isEmpty() && m_openKey == key && canUndo()) {
        HistoryEntry& top = m_undoStack.top();
        top.redo = std::move(entry.redo);
        top.resources += entry.resources;
        emit historyChanged();
        return;
    }

    const bool hadUndo = canUndo();
    m_undoStack.push(std::move(entry));
    m_openKey = coalesce ? key : QString();
    trimUndoStack();
    clearRedoStack();

    if (!hadUndo) {
        emit undoAvailableChanged(true);
    }
    emit historyChanged();
}

bool UndoHistory::undo()
{
    seal();
    if (m_undoStack.isEmpty()) {
        return false;
    }

    HistoryEntry entry = m_undoStack.pop();
    if (entry.undo) {
        entry.undo();
    }
    m_redoStack.push(std::move(entry));

    emit undoAvailableChanged(canUndo());
    emit redoAvailableChanged(canRedo());
    emit historyChanged();
    return true;
}

bool UndoHistory::redo()
{
    seal();
    if (m_redoStack.isEmpty()) {
        return false;
    }

    HistoryEntry entry = m_redoStack.pop();
    if (entry.redo) {
        entry.redo();
    }
    m_undoStack.push(std::move(entry));

    emit undoAvailableChanged(canUndo());
    emit redoAvailableChanged(canRedo());
    emit historyChanged();
    return true;
}

void UndoHistory::clear()
{
    const bool hadUndo = canUndo();
    const bool hadRedo = canRedo();
    m_undoStack.clear();
    m_redoStack.clear();
    seal();

    if (hadUndo) emit undoAvailableChanged(false);
    if (hadRedo) emit redoAvailableChanged(false);
}

void UndoHistory::setMaxDepth(int depth)
{
    m_maxDepth = qMax(1, depth);
    trimUndoStack();
}

void UndoHistory::trimUndoStack()
{
    // Oldest entry is at the bottom of the stack (index 0)
    while (m_undoStack.size() > m_maxDepth) {
        qDebug() << "UndoHistory::trimUndoStack: evicting" << m_undoStack.first().key;
        m_undoStack.remove(0);
    }
}

void UndoHistory::clearRedoStack()
{
    if (m_redoStack.isEmpty()) {
        return;
    }
    m_redoStack.clear();
    emit redoAvailableChanged(false);
}
