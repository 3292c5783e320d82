#ifndef FOREGROUNDWATCHER_H
#define FOREGROUNDWATCHER_H

#include <QObject>
#include <QString>
#include <QTimer>
#include <atomic>
#include <memory>

class AppSettings;
class ProcessNameResolver;

// Polls the foreground process and reports whether the target application
// (or this program itself) has input focus. Meant to be moved to a dedicated
// QThread; start() and stop() then run in that thread.
class ForegroundWatcher : public QObject {
    Q_OBJECT

public:
    ForegroundWatcher(AppSettings *settings, std::unique_ptr<ProcessNameResolver> resolver,
                      QObject *parent = nullptr);
    ~ForegroundWatcher();

    bool isTargetActive() const { return targetActive; }
    bool isRunning() const { return running; }

    // Thread-safe. The loop exits at its next check; blocking UI dispatches
    // started by a transition give up as well.
    void requestStop();
    bool isStopRequested() const { return stopRequested; }
    const std::atomic<bool> *stopFlag() const { return &stopRequested; }

    // One watcher tick. Returns the delay in ms before the next tick.
    int pollOnce();

    // Executable name that always counts as active (the overlay itself)
    void setOwnProcessName(const QString &name) { ownProcessName = name; }

signals:
    // Emitted from the watcher thread on every state change
    void targetActiveChanged(bool active);

public slots:
    void start();
    void stop();

private slots:
    void onPollTimeout();

private:
    bool refreshTargetActive(bool previous);
    bool isTargetProcess(const QString &fileName) const;

    AppSettings *settings;
    std::unique_ptr<ProcessNameResolver> resolver;
    QTimer *pollTimer;
    QString ownProcessName;

    // Notes start out shown, so the initial state is active
    std::atomic<bool> targetActive{true};
    std::atomic<bool> stopRequested{false};
    std::atomic<bool> running{false};
};

#endif // FOREGROUNDWATCHER_H
