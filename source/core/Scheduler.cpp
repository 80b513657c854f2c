#include "Scheduler.h"

#include <QTimer>

#include <utility>

// ===== Frame callbacks =====

Scheduler::TaskId Scheduler::requestFrame(Task task)
{
    const TaskId id = nextId();
    m_frameTasks.append(FrameTask{id, std::move(task)});
    return id;
}

bool Scheduler::cancelFrame(TaskId id)
{
    for (int i = 0; i < m_frameTasks.size(); ++i) {
        if (m_frameTasks[i].id == id) {
            m_frameTasks.removeAt(i);
            return true;
        }
    }
    return false;
}

bool Scheduler::isFramePending(TaskId id) const
{
    for (const FrameTask& frameTask : m_frameTasks) {
        if (frameTask.id == id) {
            return true;
        }
    }
    return false;
}

int Scheduler::runFrame()
{
    // Take ownership first: callbacks may request new frames or cancel queued ones
    QVector<FrameTask> tasks;
    tasks.swap(m_frameTasks);
    for (FrameTask& frameTask : tasks) {
        frameTask.task();
    }
    return static_cast<int>(tasks.size());
}

// ===== TimerScheduler =====

TimerScheduler::TimerScheduler(QObject* parent)
    : QObject(parent)
{
}

TimerScheduler::~TimerScheduler()
{
    for (QTimer* timer : std::as_const(m_timers)) {
        timer->stop();
    }
}

Scheduler::TaskId TimerScheduler::schedule(int delayMs, Task task)
{
    const TaskId id = nextId();
    auto* timer = new QTimer(this);
    timer->setSingleShot(true);
    connect(timer, &QTimer::timeout, this, [this, id, timer, task = std::move(task)]() {
        m_timers.remove(id);
        timer->deleteLater();
        task();
    });
    m_timers.insert(id, timer);
    timer->start(qMax(0, delayMs));
    return id;
}

bool TimerScheduler::cancel(TaskId id)
{
    QTimer* timer = m_timers.take(id);
    if (!timer) {
        return false;
    }
    timer->stop();
    timer->deleteLater();
    return true;
}

bool TimerScheduler::isPending(TaskId id) const
{
    return m_timers.contains(id);
}

// ===== ManualScheduler =====

Scheduler::TaskId ManualScheduler::schedule(int delayMs, Task task)
{
    const TaskId id = nextId();
    m_tasks[id] = PendingTask{m_now + qMax(0, delayMs), std::move(task)};
    return id;
}

bool ManualScheduler::cancel(TaskId id)
{
    return m_tasks.erase(id) > 0;
}

bool ManualScheduler::isPending(TaskId id) const
{
    return m_tasks.find(id) != m_tasks.end();
}

void ManualScheduler::advance(qint64 ms)
{
    const qint64 target = m_now + qMax<qint64>(0, ms);

    while (true) {
        // earliest due task, ties resolved in scheduling order
        auto next = m_tasks.end();
        for (auto it = m_tasks.begin(); it != m_tasks.end(); ++it) {
            if (it->second.due <= target && (next == m_tasks.end() || it->second.due < next->second.due)) {
                next = it;
            }
        }
        if (next == m_tasks.end()) {
            break;
        }
        m_now = next->second.due;
        Task task = std::move(next->second.task);
        m_tasks.erase(next);
        task();
    }
    m_now = target;
}
