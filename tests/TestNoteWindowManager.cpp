#include <QtTest>
#include <QSignalSpy>
#include <QTemporaryDir>
#include <QtConcurrent/QtConcurrentRun>
#include "AppSettings.h"
#include "ForegroundWatcher.h"
#include "NoteStore.h"
#include "NoteWindowManager.h"
#include "UiDispatcher.h"
#include "TestDoubles.h"

class TestNoteWindowManager : public QObject {
    Q_OBJECT

private slots:
    void init();
    void cleanup();

    void showAllOpensEveryNonDefaultNote();
    void showAllTwiceDoesNotLeakViews();
    void closeAllAbortsStaggeredShow();
    void addNoteOpensCenteredView();
    void addNoteBesideParent();
    void addNoteUsesDefaultStyle();
    void addDuringShowAllOpensOnce();
    void removeNoteClosesViewAndPersists();
    void removeUnknownNoteIsNoOp();
    void removeDefaultNoteIsRefused();
    void removeDuringShowAllDoesNotReopen();
    void editsAreSavedAfterDebounce();
    void newViewsFollowHiddenState();
    void watcherTransitionTogglesViews();

private:
    QList<Note> addNotes(int count);
    QString savedFile() const;

    QScopedPointer<QTemporaryDir> tempDir;
    NoteStore *store = nullptr;
    UiDispatcher *dispatcher = nullptr;
    NoteWindowManager *manager = nullptr;
};

void TestNoteWindowManager::init() {
    tempDir.reset(new QTemporaryDir);
    QVERIFY(tempDir->isValid());

    store = new NoteStore;
    store->setFilePath(tempDir->filePath("notes.xml"));
    store->load();

    dispatcher = new UiDispatcher;
    manager = new NoteWindowManager(store, dispatcher);
    manager->setViewFactory([](const Note &note) { return new FakeView(note); });
}

void TestNoteWindowManager::cleanup() {
    delete manager;
    QThreadPool::globalInstance()->waitForDone();
    delete dispatcher;
    delete store;
    QVERIFY(FakeView::live.isEmpty());
}

QList<Note> TestNoteWindowManager::addNotes(int count) {
    QList<Note> added;
    for (int i = 0; i < count; ++i) {
        Note note = Note::createNew();
        note.x = 40 * i;
        note.text = QString("note %1").arg(i);
        store->addNote(note);
        added.append(note);
    }
    return added;
}

QString TestNoteWindowManager::savedFile() const {
    QFile file(store->filePath());
    if (!file.open(QIODevice::ReadOnly)) {
        return QString();
    }
    return QString::fromUtf8(file.readAll());
}

void TestNoteWindowManager::showAllOpensEveryNonDefaultNote() {
    const QList<Note> notes = addNotes(3);
    QSignalSpy openedSpy(manager, &NoteWindowManager::viewOpened);

    QFuture<void> shown = manager->showAll();
    QTRY_VERIFY(shown.isFinished());

    QCOMPARE(manager->viewCount(), 3);
    QCOMPARE(openedSpy.count(), 3);
    QVERIFY(!manager->trackedNoteIds().contains(store->defaultNote()->id));
    for (const Note &note : notes) {
        FakeView *view = FakeView::find(note.id);
        QVERIFY(view);
        QVERIFY(view->shown);
        QCOMPARE(view->boundNote.text, note.text);
    }
}

void TestNoteWindowManager::showAllTwiceDoesNotLeakViews() {
    addNotes(2);

    QFuture<void> first = manager->showAll();
    QFuture<void> second = manager->showAll();
    QTRY_VERIFY(first.isFinished() && second.isFinished());

    QCOMPARE(manager->viewCount(), 2);
    QCOMPARE(FakeView::live.size(), 2);
}

void TestNoteWindowManager::closeAllAbortsStaggeredShow() {
    addNotes(5);
    QSignalSpy closedSpy(manager, &NoteWindowManager::viewClosed);

    QFuture<void> shown = manager->showAll();
    QFuture<void> closed = manager->closeAll();
    QTRY_VERIFY(shown.isFinished() && closed.isFinished());

    // Give any stray stagger timer the chance to fire
    QTest::qWait(5 * NoteWindowManager::StaggerDelayMs * 2);

    QCOMPARE(manager->viewCount(), 0);
    QVERIFY(FakeView::live.isEmpty());
    QCOMPARE(closedSpy.count(), 1);
}

void TestNoteWindowManager::addNoteOpensCenteredView() {
    QFuture<bool> added = manager->addNote();
    QTRY_VERIFY(added.isFinished());
    QVERIFY(added.result());

    QCOMPARE(manager->viewCount(), 1);
    QCOMPARE(store->count(), 2);

    const QString id = manager->trackedNoteIds().first();
    const Note stored = *store->note(id);
    QVERIFY(!stored.isDefault);
    QCOMPARE(stored.w, Note::DefaultNoteSize);
    QCOMPARE(stored.h, Note::DefaultNoteSize);
    // Placement written back from the view
    QCOMPARE(stored.rect().topLeft(), FakeView::CenterPos);

    NoteStore reloaded;
    reloaded.load(store->filePath());
    QVERIFY(reloaded.contains(id));
}

void TestNoteWindowManager::addNoteBesideParent() {
    Note parent = Note::createNew();
    parent.x = 100;
    parent.y = 50;
    parent.w = 250;
    store->addNote(parent);

    QFuture<bool> added = manager->addNote(parent.id);
    QTRY_VERIFY(added.isFinished());
    QVERIFY(added.result());

    const QString id = manager->trackedNoteIds().first();
    const Note child = *store->note(id);
    QCOMPARE(child.x, 100.0 + 250.0 + NoteWindowManager::NewNoteGap);
    QCOMPARE(child.y, 50.0);
}

void TestNoteWindowManager::addNoteUsesDefaultStyle() {
    Note style = *store->defaultNote();
    style.fontFamily = "Consolas";
    style.backColor = "#ff112233";
    QVERIFY(store->updateNote(style));

    QFuture<bool> added = manager->addNote();
    QTRY_VERIFY(added.isFinished());

    const Note note = *store->note(manager->trackedNoteIds().first());
    QCOMPARE(note.fontFamily, QString("Consolas"));
    QCOMPARE(note.backColor, QString("#ff112233"));
}

void TestNoteWindowManager::addDuringShowAllOpensOnce() {
    QSignalSpy openedSpy(manager, &NoteWindowManager::viewOpened);

    // Both queued in the same turn; showAll() already sees the new note
    QFuture<void> shown = manager->showAll();
    QFuture<bool> added = manager->addNote();
    QTRY_VERIFY(shown.isFinished() && added.isFinished());
    QVERIFY(added.result());

    QCOMPARE(manager->viewCount(), 1);
    QCOMPARE(FakeView::live.size(), 1);
    QCOMPARE(openedSpy.count(), 1);

    const QString id = manager->trackedNoteIds().first();
    QCOMPARE(store->note(id)->rect().topLeft(), FakeView::CenterPos);

    QFuture<bool> removed = manager->removeNote(id);
    QTRY_VERIFY(removed.isFinished());
    QCOMPARE(manager->viewCount(), 0);
    QVERIFY(FakeView::live.isEmpty());
}

void TestNoteWindowManager::removeNoteClosesViewAndPersists() {
    const QList<Note> notes = addNotes(2);
    QFuture<void> shown = manager->showAll();
    QTRY_VERIFY(shown.isFinished());

    QFuture<bool> removed = manager->removeNote(notes.first().id);
    QTRY_VERIFY(removed.isFinished());
    QVERIFY(removed.result());

    QCOMPARE(manager->viewCount(), 1);
    QVERIFY(!FakeView::find(notes.first().id));
    QVERIFY(!store->contains(notes.first().id));

    NoteStore reloaded;
    reloaded.load(store->filePath());
    QVERIFY(!reloaded.contains(notes.first().id));
    QVERIFY(reloaded.contains(notes.last().id));
}

void TestNoteWindowManager::removeUnknownNoteIsNoOp() {
    addNotes(1);
    QFuture<void> shown = manager->showAll();
    QTRY_VERIFY(shown.isFinished());

    QFuture<bool> removed = manager->removeNote("no-such-note");
    QTRY_VERIFY(removed.isFinished());
    QVERIFY(removed.result());

    QCOMPARE(manager->viewCount(), 1);
    QCOMPARE(store->count(), 2);
    // Nothing to persist
    QVERIFY(!QFile::exists(store->filePath()));
}

void TestNoteWindowManager::removeDefaultNoteIsRefused() {
    const QString defaultId = store->defaultNote()->id;

    QFuture<bool> removed = manager->removeNote(defaultId);
    QVERIFY(removed.isFinished());
    QVERIFY(!removed.result());
    QVERIFY(store->contains(defaultId));
}

void TestNoteWindowManager::removeDuringShowAllDoesNotReopen() {
    const QList<Note> notes = addNotes(4);

    QFuture<void> shown = manager->showAll();
    QFuture<bool> removed = manager->removeNote(notes.last().id);
    QTRY_VERIFY(shown.isFinished() && removed.isFinished());

    QCOMPARE(manager->viewCount(), 3);
    QVERIFY(!FakeView::find(notes.last().id));
}

void TestNoteWindowManager::editsAreSavedAfterDebounce() {
    const QList<Note> notes = addNotes(1);
    QFuture<void> shown = manager->showAll();
    QTRY_VERIFY(shown.isFinished());

    Note edited = notes.first();
    edited.text = "typed in the window";
    edited.x = 321;
    manager->onViewEdited(edited);

    // The store sees the edit at once, the file only after the debounce
    QCOMPARE(store->note(edited.id)->text, edited.text);
    QVERIFY(!savedFile().contains(edited.text));

    QTRY_VERIFY_WITH_TIMEOUT(savedFile().contains("typed in the window"),
                             NoteWindowManager::EditSaveDelayMs * 10);
    QVERIFY(savedFile().contains("<X>321</X>"));
}

void TestNoteWindowManager::newViewsFollowHiddenState() {
    manager->setViewsVisible(false);

    QFuture<bool> added = manager->addNote();
    QTRY_VERIFY(added.isFinished());

    FakeView *view = FakeView::find(manager->trackedNoteIds().first());
    QVERIFY(view);
    QVERIFY(!view->isViewVisible());
}

void TestNoteWindowManager::watcherTransitionTogglesViews() {
    addNotes(3);
    QFuture<void> shown = manager->showAll();
    QTRY_VERIFY(shown.isFinished());

    AppSettings settings(tempDir->filePath("settings.ini"), nullptr);
    auto resolver = std::make_unique<FixedResolver>();
    FixedResolver *fixed = resolver.get();
    ForegroundWatcher watcher(&settings, std::move(resolver));
    manager->attachWatcher(&watcher);

    // Ticks run off the UI thread, as they do in the application
    fixed->setName("explorer.exe");
    QFuture<int> tick = QtConcurrent::run([&watcher]() { return watcher.pollOnce(); });
    QTRY_VERIFY(tick.isFinished());

    QVERIFY(!manager->viewsVisible());
    for (FakeView *view : FakeView::live) {
        QVERIFY(!view->isViewVisible());
    }

    fixed->setName("ffxiv.exe");
    tick = QtConcurrent::run([&watcher]() { return watcher.pollOnce(); });
    QTRY_VERIFY(tick.isFinished());

    QVERIFY(manager->viewsVisible());
    for (FakeView *view : FakeView::live) {
        QVERIFY(view->isViewVisible());
    }
}

QTEST_GUILESS_MAIN(TestNoteWindowManager)
#include "TestNoteWindowManager.moc"
