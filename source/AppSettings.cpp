#include "AppSettings.h"
#include <QMutexLocker>
#include <QtGlobal>

AppSettings::AppSettings(QObject *parent)
    : QObject(parent), settings("OverlayNotes", "App")
{
    loadSettings();
}

AppSettings::AppSettings(const QString &iniPath, QObject *parent)
    : QObject(parent), settings(iniPath, QSettings::IniFormat)
{
    loadSettings();
}

void AppSettings::loadSettings() {
    hideWhenAbsent = settings.value("hideWhenTargetAbsent", true).toBool();
    pollInterval = qMax(MinimumPollIntervalMs, settings.value("pollIntervalMs", DefaultPollIntervalMs).toInt());

    QStringList names = settings.value("targetProcessNames", defaultTargetProcessNames()).toStringList();
    names.removeAll(QString());
    if (names.isEmpty()) {
        names = defaultTargetProcessNames();
    }

    QMutexLocker locker(&namesMutex);
    targetNames = names;
}

QStringList AppSettings::defaultTargetProcessNames() {
    return { QStringLiteral("ffxiv.exe"), QStringLiteral("ffxiv_dx11.exe") };
}

bool AppSettings::hideWhenTargetAbsent() const {
    return hideWhenAbsent;
}

void AppSettings::setHideWhenTargetAbsent(bool hide) {
    if (hideWhenAbsent.exchange(hide) == hide) return;
    settings.setValue("hideWhenTargetAbsent", hide);
    emit changed();
}

int AppSettings::pollIntervalMs() const {
    return pollInterval;
}

void AppSettings::setPollIntervalMs(int ms) {
    ms = qMax(MinimumPollIntervalMs, ms);
    if (pollInterval.exchange(ms) == ms) return;
    settings.setValue("pollIntervalMs", ms);
    emit changed();
}

QStringList AppSettings::targetProcessNames() const {
    QMutexLocker locker(&namesMutex);
    return targetNames;
}

void AppSettings::setTargetProcessNames(const QStringList &names) {
    QStringList cleaned = names;
    cleaned.removeAll(QString());
    if (cleaned.isEmpty()) {
        cleaned = defaultTargetProcessNames();
    }
    {
        QMutexLocker locker(&namesMutex);
        if (targetNames == cleaned) return;
        targetNames = cleaned;
    }
    settings.setValue("targetProcessNames", cleaned);
    emit changed();
}
