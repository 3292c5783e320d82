#ifndef NOTEWINDOWMANAGER_H
#define NOTEWINDOWMANAGER_H

#include <QObject>
#include <QFuture>
#include <QList>
#include <QSet>
#include <QString>
#include <QStringList>
#include <QTimer>
#include <memory>
#include "NoteView.h"

class NoteStore;
class UiDispatcher;
class ForegroundWatcher;

// Keeps one view open per non-default note and keeps the views consistent
// with the store. Every view operation is marshalled onto the UI thread
// through the dispatcher; saves run on the global thread pool.
class NoteWindowManager : public QObject {
    Q_OBJECT

public:
    NoteWindowManager(NoteStore *store, UiDispatcher *dispatcher, QObject *parent = nullptr);
    ~NoteWindowManager();

    void setViewFactory(NoteViewFactory factory);

    // Hide/show all views whenever the watcher's state flips
    void attachWatcher(ForegroundWatcher *watcher);

    // Window management
    QFuture<void> showAll();
    QFuture<void> closeAll();
    QFuture<bool> addNote(const QString &parentId = QString());
    QFuture<bool> removeNote(const QString &id);

    // UI thread only
    void setViewsVisible(bool visible);
    bool viewsVisible() const { return visibleState; }
    int viewCount() const;
    QStringList trackedNoteIds() const;

    static constexpr int StaggerDelayMs = 10;
    static constexpr int NewNoteGap = 3;
    static constexpr int EditSaveDelayMs = 500;

public slots:
    // Called by a view when the user moved, resized or typed
    void onViewEdited(const Note &note);

signals:
    void viewOpened(const QString &id);
    void viewClosed(const QString &id);

private:
    struct ShowAllRun;

    NoteView *openView(const Note &note, bool centerOnScreen = false);
    void closeTrackedViews();
    void closeView(NoteView *view);
    NoteView *findView(const QString &id) const;
    void showNextStaggered(const std::shared_ptr<ShowAllRun> &run);
    QFuture<bool> saveInBackground();
    void flushPendingEdits();

    NoteStore *store;
    UiDispatcher *dispatcher;
    NoteViewFactory viewFactory;

    QList<NoteView *> views;
    bool visibleState = true;

    // Bumped by closeAll()/showAll() so stale staggered runs stop
    int showGeneration = 0;

    QTimer *saveDebounceTimer;
    QSet<QString> pendingEditIds;
};

#endif // NOTEWINDOWMANAGER_H
