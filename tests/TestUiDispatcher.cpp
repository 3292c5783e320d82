#include <QtTest>
#include <QThread>
#include <QtConcurrent/QtConcurrentRun>
#include <atomic>
#include <stdexcept>
#include "UiDispatcher.h"

class TestUiDispatcher : public QObject {
    Q_OBJECT

private slots:
    void invokeOnUiThreadRunsInline();
    void invokeFromWorkerRunsOnUiThread();
    void invokeRethrowsToCaller();
    void invokeGivesUpWhenStopped();
    void postFinishesFuture();
    void postStoresException();
    void idleRunsAfterNormal();
    void destroyedDispatcherCancels();
};

void TestUiDispatcher::invokeOnUiThreadRunsInline() {
    UiDispatcher dispatcher;
    QVERIFY(dispatcher.isUiThread());

    bool ran = false;
    QVERIFY(dispatcher.invoke([&ran]() { ran = true; }));
    QVERIFY(ran);
}

void TestUiDispatcher::invokeFromWorkerRunsOnUiThread() {
    UiDispatcher dispatcher;
    QThread *uiThread = QThread::currentThread();
    QThread *ranOn = nullptr;

    QFuture<bool> worker = QtConcurrent::run([&dispatcher, &ranOn]() {
        return dispatcher.invoke([&ranOn]() { ranOn = QThread::currentThread(); });
    });

    // The closure needs this thread's event loop
    QTRY_VERIFY(worker.isFinished());
    QVERIFY(worker.result());
    QCOMPARE(ranOn, uiThread);
}

void TestUiDispatcher::invokeRethrowsToCaller() {
    UiDispatcher dispatcher;

    QFuture<QString> worker = QtConcurrent::run([&dispatcher]() {
        try {
            dispatcher.invoke([]() { throw std::runtime_error("boom"); });
        } catch (const std::runtime_error &e) {
            return QString::fromUtf8(e.what());
        }
        return QString();
    });

    QTRY_VERIFY(worker.isFinished());
    QCOMPARE(worker.result(), QString("boom"));
}

void TestUiDispatcher::invokeGivesUpWhenStopped() {
    UiDispatcher dispatcher;
    std::atomic<bool> stop{false};
    std::atomic<bool> ran{false};

    QFuture<bool> worker = QtConcurrent::run([&dispatcher, &stop, &ran]() {
        return dispatcher.invoke([&ran]() { ran = true; }, UiDispatcher::Priority::Idle, &stop);
    });

    // No event processing here, so the closure cannot run yet
    QThread::msleep(100);
    stop = true;
    worker.waitForFinished();

    QVERIFY(!worker.result());
    QVERIFY(!ran);

    // Still queued; runs once the loop spins
    QTRY_VERIFY(ran);
}

void TestUiDispatcher::postFinishesFuture() {
    UiDispatcher dispatcher;
    int value = 0;

    QFuture<void> future = dispatcher.post([&value]() { value = 42; });
    QVERIFY(!future.isFinished());

    QTRY_VERIFY(future.isFinished());
    QCOMPARE(value, 42);
    QVERIFY(!future.isCanceled());
}

void TestUiDispatcher::postStoresException() {
    UiDispatcher dispatcher;

    QFuture<void> future = dispatcher.post([]() { throw std::runtime_error("failed"); });
    QTRY_VERIFY(future.isFinished());

    bool thrown = false;
    try {
        future.waitForFinished();
    } catch (const std::runtime_error &e) {
        thrown = QByteArray(e.what()) == "failed";
    }
    QVERIFY(thrown);
}

void TestUiDispatcher::idleRunsAfterNormal() {
    UiDispatcher dispatcher;
    QStringList order;

    QFuture<void> idle = dispatcher.post([&order]() { order << "idle"; }, UiDispatcher::Priority::Idle);
    QFuture<void> normal = dispatcher.post([&order]() { order << "normal"; });

    QTRY_VERIFY(idle.isFinished() && normal.isFinished());
    QCOMPARE(order, QStringList({ "normal", "idle" }));
}

void TestUiDispatcher::destroyedDispatcherCancels() {
    auto *dispatcher = new UiDispatcher;
    bool ran = false;

    QFuture<void> future = dispatcher->post([&ran]() { ran = true; });
    delete dispatcher;

    QVERIFY(future.isCanceled());
    QCoreApplication::processEvents();
    QVERIFY(!ran);
}

QTEST_GUILESS_MAIN(TestUiDispatcher)
#include "TestUiDispatcher.moc"
