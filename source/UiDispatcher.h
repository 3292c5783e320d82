#ifndef UIDISPATCHER_H
#define UIDISPATCHER_H

#include <QObject>
#include <QFuture>
#include <atomic>
#include <functional>

// Runs closures on the thread that owns the dispatcher (the UI thread).
// Closures are queued as events, so Idle work only runs once the pending
// normal-priority events have drained.
class UiDispatcher : public QObject {
    Q_OBJECT

public:
    enum class Priority {
        Normal,
        Idle
    };

    explicit UiDispatcher(QObject *parent = nullptr);

    bool isUiThread() const;

    // Blocks the calling thread until fn has run on the UI thread and
    // rethrows whatever fn threw. Called on the UI thread it runs fn inline.
    // Returns false without waiting further once *stopFlag becomes true or
    // the dispatcher is destroyed; fn may then still run later.
    bool invoke(std::function<void()> fn, Priority priority = Priority::Normal,
                const std::atomic<bool> *stopFlag = nullptr);

    // Queues fn and returns immediately. The future finishes after fn ran and
    // carries its exception, or is canceled if the dispatcher goes away first.
    QFuture<void> post(std::function<void()> fn, Priority priority = Priority::Normal);

protected:
    void customEvent(QEvent *event) override;
};

#endif // UIDISPATCHER_H
