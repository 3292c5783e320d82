#ifndef NOTESCONTROLLER_H
#define NOTESCONTROLLER_H

#include <QObject>
#include <QFuture>
#include <QString>
#include <memory>
#include "NoteView.h"

class QThread;
class AppSettings;
class NoteStore;
class UiDispatcher;
class NoteWindowManager;
class ForegroundWatcher;
class ProcessNameResolver;

// Top-level entry point of the overlay: owns the store, the window manager
// and the foreground watcher thread. Construct it on the UI thread.
class NotesController : public QObject {
    Q_OBJECT

public:
    // resolver == nullptr uses the platform resolver. viewFactory == nullptr
    // opens a NoteWindow per note.
    NotesController(AppSettings *settings, std::unique_ptr<ProcessNameResolver> resolver = nullptr,
                    NoteViewFactory viewFactory = nullptr, QObject *parent = nullptr);
    ~NotesController();

    void load();
    bool save(QString *errorMessage = nullptr);

    QFuture<bool> addNote(const QString &parentId = QString());
    QFuture<bool> removeNote(const QString &id);
    QFuture<void> showAll();
    QFuture<void> closeAll();

    // Idempotent. The watcher runs on its own lowest-priority thread.
    void startWatcher();
    void stopWatcher();
    bool isWatcherRunning() const;

    AppSettings *settings() const { return appSettings; }
    NoteStore *store() const { return noteStore; }
    NoteWindowManager *windows() const { return windowManager; }
    ForegroundWatcher *watcher() const { return foregroundWatcher; }

private:
    NoteView *createNoteWindow(const Note &note);

    AppSettings *appSettings;
    NoteStore *noteStore;
    UiDispatcher *dispatcher;
    NoteWindowManager *windowManager;

    ForegroundWatcher *foregroundWatcher;
    QThread *watcherThread;
};

#endif // NOTESCONTROLLER_H
