#include "UiDispatcher.h"
#include <QCoreApplication>
#include <QEvent>
#include <QPromise>
#include <QSemaphore>
#include <QThread>
#include <exception>
#include <memory>

namespace {

const int WaitSliceMs = 50;

QEvent::Type dispatchEventType() {
    static const int type = QEvent::registerEventType();
    return static_cast<QEvent::Type>(type);
}

class DispatchEvent : public QEvent {
public:
    DispatchEvent(std::function<void()> fn, std::shared_ptr<QPromise<void>> promise)
        : QEvent(dispatchEventType()), fn(std::move(fn)), promise(std::move(promise)) {}

    std::function<void()> fn;
    std::shared_ptr<QPromise<void>> promise;
};

struct InvokeState {
    QSemaphore done;
    std::exception_ptr error;
};

} // namespace

UiDispatcher::UiDispatcher(QObject *parent)
    : QObject(parent)
{
}

bool UiDispatcher::isUiThread() const {
    return QThread::currentThread() == thread();
}

bool UiDispatcher::invoke(std::function<void()> fn, Priority priority, const std::atomic<bool> *stopFlag) {
    if (isUiThread()) {
        fn();
        return true;
    }

    auto state = std::make_shared<InvokeState>();
    QFuture<void> future = post([fn = std::move(fn), state]() {
        try {
            fn();
        } catch (...) {
            state->error = std::current_exception();
        }
        state->done.release();
    }, priority);

    while (!state->done.tryAcquire(1, WaitSliceMs)) {
        if (future.isCanceled()) {
            return false;
        }
        if (stopFlag && stopFlag->load()) {
            return false;
        }
    }

    if (state->error) {
        std::rethrow_exception(state->error);
    }
    return true;
}

QFuture<void> UiDispatcher::post(std::function<void()> fn, Priority priority) {
    auto promise = std::make_shared<QPromise<void>>();
    QFuture<void> future = promise->future();
    promise->start();

    const int eventPriority = priority == Priority::Idle ? Qt::LowEventPriority : Qt::NormalEventPriority;
    QCoreApplication::postEvent(this, new DispatchEvent(std::move(fn), std::move(promise)), eventPriority);
    return future;
}

void UiDispatcher::customEvent(QEvent *event) {
    if (event->type() != dispatchEventType()) {
        QObject::customEvent(event);
        return;
    }

    auto *dispatch = static_cast<DispatchEvent *>(event);
    try {
        dispatch->fn();
    } catch (...) {
        // Handed to whoever holds the future
        dispatch->promise->setException(std::current_exception());
    }
    dispatch->promise->finish();
}
