#include "ForegroundWatcher.h"
#include "AppSettings.h"
#include "ProcessNameResolver.h"
#include <QCoreApplication>
#include <QDebug>
#include <QFileInfo>
#include <exception>

ForegroundWatcher::ForegroundWatcher(AppSettings *settings, std::unique_ptr<ProcessNameResolver> resolver,
                                     QObject *parent)
    : QObject(parent), settings(settings), resolver(std::move(resolver)), pollTimer(new QTimer(this))
{
    ownProcessName = QFileInfo(QCoreApplication::applicationFilePath()).fileName();

    pollTimer->setSingleShot(true);
    connect(pollTimer, &QTimer::timeout, this, &ForegroundWatcher::onPollTimeout);
}

ForegroundWatcher::~ForegroundWatcher() = default;

void ForegroundWatcher::start() {
    if (running.exchange(true)) {
        return;
    }
    stopRequested = false;

    // Give the host application time to finish starting up
    const int startupDelay = 2 * settings->pollIntervalMs();
    qDebug() << "ForegroundWatcher: started, first poll in" << startupDelay << "ms";
    pollTimer->start(startupDelay);
}

void ForegroundWatcher::stop() {
    stopRequested = true;
    pollTimer->stop();
    if (running.exchange(false)) {
        qDebug() << "ForegroundWatcher: stopped";
    }
}

void ForegroundWatcher::requestStop() {
    stopRequested = true;
}

void ForegroundWatcher::onPollTimeout() {
    if (stopRequested) {
        stop();
        return;
    }

    const int delay = pollOnce();

    if (stopRequested) {
        stop();
        return;
    }
    pollTimer->start(delay);
}

int ForegroundWatcher::pollOnce() {
    const int interval = settings->pollIntervalMs();
    int delay = interval;

    try {
        const bool previous = targetActive;
        const bool current = settings->hideWhenTargetAbsent() ? refreshTargetActive(previous) : true;

        if (current != previous) {
            targetActive = current;
            qDebug() << "ForegroundWatcher: target application" << (current ? "focused" : "lost focus");
            emit targetActiveChanged(current);
        }
    } catch (const std::exception &e) {
        // Back off before trying again
        qWarning() << "ForegroundWatcher: poll failed:" << e.what();
        delay += 2 * interval;
    } catch (...) {
        qWarning() << "ForegroundWatcher: poll failed with an unknown exception";
        delay += 2 * interval;
    }

    return delay;
}

bool ForegroundWatcher::refreshTargetActive(bool previous) {
    QString fileName;
    try {
        fileName = resolver->foregroundProcessName();
    } catch (const ProcessLookupError &e) {
        // Transient (access denied, process gone): keep the last state
        qDebug() << "ForegroundWatcher: foreground lookup failed:" << e.what();
        return previous;
    }
    return isTargetProcess(fileName);
}

bool ForegroundWatcher::isTargetProcess(const QString &fileName) const {
    if (fileName.isEmpty()) {
        return false;
    }
    if (!ownProcessName.isEmpty() && fileName.compare(ownProcessName, Qt::CaseInsensitive) == 0) {
        return true;
    }
    const QStringList targets = settings->targetProcessNames();
    for (const QString &target : targets) {
        if (fileName.compare(target, Qt::CaseInsensitive) == 0) {
            return true;
        }
    }
    return false;
}
