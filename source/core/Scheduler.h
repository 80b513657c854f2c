#pragma once

// ============================================================================
// Scheduler - Frame callbacks and cancellable delayed tasks
// ============================================================================
// All deferred work of the paint core goes through a Scheduler so that it can
// be cancelled deterministically (sprite disposal, tool switches) and driven
// by a virtual clock in tests.
//
// - Frame callbacks run once, on the next PaintCanvas::renderFrame().
// - Delayed tasks run once after the given delay unless cancelled.
// ============================================================================

#include <QObject>
#include <QHash>
#include <QVector>
#include <functional>
#include <map>

class QTimer;

class Scheduler {
public:
    using TaskId = quint64;
    using Task = std::function<void()>;

    virtual ~Scheduler() = default;

    // ===== Delayed tasks =====

    /**
     * @brief Run task once after delayMs.
     * @return Handle for cancel() / isPending(). Never 0.
     */
    virtual TaskId schedule(int delayMs, Task task) = 0;

    /**
     * @brief Cancel a delayed task.
     * @return True if the task was still pending.
     */
    virtual bool cancel(TaskId id) = 0;

    virtual bool isPending(TaskId id) const = 0;

    // ===== Frame callbacks =====

    /**
     * @brief Run task on the next frame.
     */
    TaskId requestFrame(Task task);

    bool cancelFrame(TaskId id);
    bool isFramePending(TaskId id) const;

    /**
     * @brief Run the frame callbacks that were queued before this call.
     * @return Number of callbacks run. Callbacks requested while running
     *         are deferred to the next frame.
     */
    int runFrame();

protected:
    TaskId nextId() { return ++m_lastId; }

private:
    struct FrameTask {
        TaskId id = 0;
        Task task;
    };
    QVector<FrameTask> m_frameTasks;
    TaskId m_lastId = 0;
};

/**
 * @brief Scheduler backed by single-shot QTimers (requires a running event loop).
 */
class TimerScheduler : public QObject, public Scheduler {
public:
    explicit TimerScheduler(QObject* parent = nullptr);
    ~TimerScheduler() override;

    TaskId schedule(int delayMs, Task task) override;
    bool cancel(TaskId id) override;
    bool isPending(TaskId id) const override;

private:
    QHash<TaskId, QTimer*> m_timers;
};

/**
 * @brief Scheduler driven by a virtual clock. Time only passes in advance().
 */
class ManualScheduler : public Scheduler {
public:
    TaskId schedule(int delayMs, Task task) override;
    bool cancel(TaskId id) override;
    bool isPending(TaskId id) const override;

    /**
     * @brief Move the clock forward, running every task that becomes due in order.
     */
    void advance(qint64 ms);

    qint64 now() const { return m_now; }
    int pendingCount() const { return static_cast<int>(m_tasks.size()); }

private:
    struct PendingTask {
        qint64 due = 0;
        Task task;
    };
    std::map<TaskId, PendingTask> m_tasks;
    qint64 m_now = 0;
};
