#ifndef APPSETTINGS_H
#define APPSETTINGS_H

#include <QObject>
#include <QMutex>
#include <QSettings>
#include <QStringList>
#include <atomic>

// User configuration stored through QSettings. Values are cached so that the
// foreground watcher can read them from its own thread without touching
// QSettings.
class AppSettings : public QObject {
    Q_OBJECT

public:
    // Uses QSettings("OverlayNotes", "App")
    explicit AppSettings(QObject *parent = nullptr);
    // Explicit backend, used by tests with an INI file
    AppSettings(const QString &iniPath, QObject *parent);

    bool hideWhenTargetAbsent() const;
    void setHideWhenTargetAbsent(bool hide);

    int pollIntervalMs() const;
    void setPollIntervalMs(int ms);

    QStringList targetProcessNames() const;
    void setTargetProcessNames(const QStringList &names);

    static QStringList defaultTargetProcessNames();

    static constexpr int DefaultPollIntervalMs = 3000;
    static constexpr int MinimumPollIntervalMs = 100;

signals:
    void changed();

private:
    void loadSettings();

    QSettings settings;
    std::atomic<bool> hideWhenAbsent{true};
    std::atomic<int> pollInterval{DefaultPollIntervalMs};

    mutable QMutex namesMutex;
    QStringList targetNames;
};

#endif // APPSETTINGS_H
