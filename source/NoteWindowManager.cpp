#include "NoteWindowManager.h"
#include "NoteStore.h"
#include "UiDispatcher.h"
#include "ForegroundWatcher.h"
#include <QDebug>
#include <QPointer>
#include <QPromise>
#include <QThread>
#include <QtConcurrent/QtConcurrentRun>
#include <exception>
#include <memory>
#include <optional>

namespace {

QFuture<bool> readyFuture(bool value) {
    QPromise<bool> promise;
    QFuture<bool> future = promise.future();
    promise.start();
    promise.addResult(value);
    promise.finish();
    return future;
}

} // namespace

struct NoteWindowManager::ShowAllRun {
    QPromise<void> promise;
    QList<Note> pending;
    int generation = 0;
};

NoteWindowManager::NoteWindowManager(NoteStore *store, UiDispatcher *dispatcher, QObject *parent)
    : QObject(parent), store(store), dispatcher(dispatcher)
{
    // Batch edits (typing, dragging) into one save
    saveDebounceTimer = new QTimer(this);
    saveDebounceTimer->setSingleShot(true);
    saveDebounceTimer->setInterval(EditSaveDelayMs);
    connect(saveDebounceTimer, &QTimer::timeout, this, &NoteWindowManager::flushPendingEdits);
}

NoteWindowManager::~NoteWindowManager() {
    saveDebounceTimer->stop();

    const QList<NoteView *> open = views;
    views.clear();
    for (NoteView *view : open) {
        view->closeView();
    }
}

void NoteWindowManager::setViewFactory(NoteViewFactory factory) {
    viewFactory = std::move(factory);
}

void NoteWindowManager::attachWatcher(ForegroundWatcher *watcher) {
    // Runs on the watcher thread and waits until the UI thread has applied
    // the new visibility. Idle priority lets pending UI work drain first.
    connect(watcher, &ForegroundWatcher::targetActiveChanged, this, [this, watcher](bool active) {
        QPointer<NoteWindowManager> self(this);
        const bool applied = dispatcher->invoke([self, active]() {
            if (self) {
                self->setViewsVisible(active);
            }
        }, UiDispatcher::Priority::Idle, watcher->stopFlag());

        if (!applied) {
            qDebug() << "NoteWindowManager: visibility change abandoned, watcher stopping";
        }
    }, Qt::DirectConnection);
}

QFuture<void> NoteWindowManager::showAll() {
    auto run = std::make_shared<ShowAllRun>();
    QFuture<void> future = run->promise.future();
    run->promise.start();

    QPointer<NoteWindowManager> self(this);
    dispatcher->post([self, run]() {
        if (!self) return;

        try {
            self->closeTrackedViews();
            run->generation = ++self->showGeneration;

            const QList<Note> notes = self->store->notes();
            for (const Note &note : notes) {
                if (!note.isDefault) {
                    run->pending.append(note);
                }
            }
        } catch (...) {
            run->promise.setException(std::current_exception());
            run->promise.finish();
            return;
        }

        self->showNextStaggered(run);
    });

    return future;
}

void NoteWindowManager::showNextStaggered(const std::shared_ptr<ShowAllRun> &run) {
    // A later showAll()/closeAll() took over
    if (run->generation != showGeneration) {
        run->promise.finish();
        return;
    }

    while (!run->pending.isEmpty()) {
        const Note queued = run->pending.takeFirst();

        // Removed or already opened by addNote() since the run started
        const std::optional<Note> current = store->note(queued.id);
        if (!current || findView(queued.id)) {
            continue;
        }

        try {
            openView(*current);
        } catch (const std::exception &e) {
            qWarning() << "NoteWindowManager: cannot open note" << queued.id << ":" << e.what();
            continue;
        }

        if (!run->pending.isEmpty()) {
            // Stagger window creation instead of opening everything at once
            QTimer::singleShot(StaggerDelayMs, this, [this, run]() {
                showNextStaggered(run);
            });
            return;
        }
    }

    run->promise.finish();
}

QFuture<void> NoteWindowManager::closeAll() {
    QPointer<NoteWindowManager> self(this);
    return dispatcher->post([self]() {
        if (!self) return;
        ++self->showGeneration;
        self->closeTrackedViews();
    });
}

QFuture<bool> NoteWindowManager::addNote(const QString &parentId) {
    const std::optional<Note> style = store->defaultNote();
    Note note = Note::createNew(style ? &*style : nullptr);

    const std::optional<Note> parent = parentId.isEmpty() ? std::nullopt : store->note(parentId);
    if (parent) {
        // Right next to the note it was created from
        note.x = parent->x + parent->w + NewNoteGap;
        note.y = parent->y;
    }

    if (!store->addNote(note)) {
        qWarning() << "NoteWindowManager: could not add note" << note.id;
        return readyFuture(false);
    }

    QPointer<NoteWindowManager> self(this);
    const bool centered = !parent.has_value();
    NoteStore *notes = store;

    return dispatcher->post([self, note, centered]() {
        if (!self) return;

        NoteView *view = self->openView(note, centered);
        if (!view) return;

        // Keep the placement the window actually got
        Note placed = note;
        placed.setRect(view->viewGeometry());
        self->store->updateNote(placed);
    }).then(QtFuture::Launch::Async, [notes]() {
        return notes->save();
    });
}

QFuture<bool> NoteWindowManager::removeNote(const QString &id) {
    const std::optional<Note> existing = store->note(id);
    if (existing && existing->isDefault) {
        qWarning() << "NoteWindowManager: the default note cannot be removed";
        return readyFuture(false);
    }

    QPointer<NoteWindowManager> self(this);
    NoteStore *notes = store;
    auto removed = std::make_shared<bool>(false);

    // The store entry goes away on the UI thread too, so a staggered
    // showAll() still in progress cannot reopen the note
    return dispatcher->post([self, id, removed]() {
        if (!self) return;

        self->pendingEditIds.remove(id);
        if (NoteView *view = self->findView(id)) {
            self->closeView(view);
        }
        *removed = self->store->removeNote(id);
    }).then(QtFuture::Launch::Async, [notes, removed]() {
        if (!*removed) {
            // Unknown id: nothing changed, nothing to persist
            return true;
        }
        return notes->save();
    });
}

void NoteWindowManager::setViewsVisible(bool visible) {
    visibleState = visible;

    const QList<NoteView *> open = views;
    for (NoteView *view : open) {
        view->setViewVisible(visible);
        QThread::yieldCurrentThread();
    }
}

int NoteWindowManager::viewCount() const {
    return views.size();
}

QStringList NoteWindowManager::trackedNoteIds() const {
    QStringList ids;
    for (NoteView *view : views) {
        ids.append(view->noteId());
    }
    return ids;
}

void NoteWindowManager::onViewEdited(const Note &note) {
    if (!store->updateNote(note)) {
        return; // removed in the meantime
    }
    pendingEditIds.insert(note.id);
    saveDebounceTimer->start();
}

void NoteWindowManager::flushPendingEdits() {
    if (pendingEditIds.isEmpty()) return;
    pendingEditIds.clear();
    saveInBackground();
}

QFuture<bool> NoteWindowManager::saveInBackground() {
    NoteStore *notes = store;
    return QtConcurrent::run([notes]() {
        return notes->save();
    });
}

NoteView *NoteWindowManager::openView(const Note &note, bool centerOnScreen) {
    // A queued showAll() may already have opened it
    if (NoteView *existing = findView(note.id)) {
        if (centerOnScreen) {
            existing->centerOnScreen();
        }
        return existing;
    }

    if (!viewFactory) {
        qWarning() << "NoteWindowManager: no view factory set";
        return nullptr;
    }

    NoteView *view = viewFactory(note);
    if (!view) {
        qWarning() << "NoteWindowManager: view factory returned no view for" << note.id;
        return nullptr;
    }

    if (centerOnScreen) {
        view->centerOnScreen();
    }
    view->showView();
    if (!visibleState) {
        view->setViewVisible(false);
    }

    views.append(view);
    emit viewOpened(note.id);
    return view;
}

void NoteWindowManager::closeTrackedViews() {
    const QList<NoteView *> open = views;
    views.clear();
    for (NoteView *view : open) {
        const QString id = view->noteId();
        view->closeView();
        emit viewClosed(id);
    }
}

void NoteWindowManager::closeView(NoteView *view) {
    views.removeAll(view);
    const QString id = view->noteId();
    view->closeView();
    emit viewClosed(id);
}

NoteView *NoteWindowManager::findView(const QString &id) const {
    for (NoteView *view : views) {
        if (view->noteId() == id) {
            return view;
        }
    }
    return nullptr;
}
