#include "NotesController.h"
#include "AppSettings.h"
#include "ForegroundWatcher.h"
#include "NoteStore.h"
#include "NoteWindow.h"
#include "NoteWindowManager.h"
#include "ProcessNameResolver.h"
#include "UiDispatcher.h"
#include <QDebug>
#include <QThread>
#include <QThreadPool>

NotesController::NotesController(AppSettings *settings, std::unique_ptr<ProcessNameResolver> resolver,
                                 NoteViewFactory viewFactory, QObject *parent)
    : QObject(parent), appSettings(settings)
{
    noteStore = new NoteStore(this);
    dispatcher = new UiDispatcher(this);
    windowManager = new NoteWindowManager(noteStore, dispatcher, this);

    if (viewFactory) {
        windowManager->setViewFactory(std::move(viewFactory));
    } else {
        windowManager->setViewFactory([this](const Note &note) {
            return createNoteWindow(note);
        });
    }

    if (!resolver) {
        resolver = std::make_unique<SystemProcessNameResolver>();
    }

    // Same pattern as any worker object: no parent, moved to its own thread
    foregroundWatcher = new ForegroundWatcher(appSettings, std::move(resolver));
    watcherThread = new QThread(this);
    watcherThread->setObjectName("ForegroundWatcher");
    foregroundWatcher->moveToThread(watcherThread);
    connect(watcherThread, &QThread::started, foregroundWatcher, &ForegroundWatcher::start);

    windowManager->attachWatcher(foregroundWatcher);

    connect(noteStore, &NoteStore::saveFailed, this, [](const QString &message) {
        qWarning() << "NotesController: notes could not be saved:" << message;
    });
}

NotesController::~NotesController() {
    stopWatcher();
    delete foregroundWatcher;
    foregroundWatcher = nullptr;

    // Background saves still reference the store
    QThreadPool::globalInstance()->waitForDone();
}

void NotesController::load() {
    noteStore->load();
}

bool NotesController::save(QString *errorMessage) {
    return noteStore->save(errorMessage);
}

QFuture<bool> NotesController::addNote(const QString &parentId) {
    return windowManager->addNote(parentId);
}

QFuture<bool> NotesController::removeNote(const QString &id) {
    return windowManager->removeNote(id);
}

QFuture<void> NotesController::showAll() {
    return windowManager->showAll();
}

QFuture<void> NotesController::closeAll() {
    return windowManager->closeAll();
}

void NotesController::startWatcher() {
    if (watcherThread->isRunning()) {
        return;
    }
    watcherThread->start(QThread::LowestPriority);
}

void NotesController::stopWatcher() {
    if (!watcherThread->isRunning()) {
        return;
    }

    // Unblocks a pending visibility dispatch, then the watcher stops its
    // timer and ends the thread's event loop from inside the thread.
    foregroundWatcher->requestStop();
    ForegroundWatcher *watcher = foregroundWatcher;
    QMetaObject::invokeMethod(foregroundWatcher, [watcher]() {
        watcher->stop();
        QThread::currentThread()->quit();
    }, Qt::QueuedConnection);

    watcherThread->wait();
}

bool NotesController::isWatcherRunning() const {
    return watcherThread->isRunning();
}

NoteView *NotesController::createNoteWindow(const Note &note) {
    auto *window = new NoteWindow(note);

    connect(window, &NoteWindow::noteEdited, windowManager, &NoteWindowManager::onViewEdited);
    connect(window, &NoteWindow::addRequested, this, [this](const QString &parentId) {
        addNote(parentId);
    });
    connect(window, &NoteWindow::deleteRequested, this, [this](const QString &id) {
        removeNote(id);
    });

    return window;
}
