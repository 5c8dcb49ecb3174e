#pragma once

#include <chrono>
#include <optional>

#include <QFuture>
#include <QFutureWatcher>
#include <QObject>
#include <QTimer>

#include <qcorotask.h>
#include <qcorosignal.h>

/*! Merges "the work finished" and "the deadline expired" into one signal
 *  so a coroutine can wait for whichever comes first.
 */
class StageEventProxy : public QObject {
    Q_OBJECT
public:
    enum class Event {
        Finished,
        Timeout
    };
    Q_ENUM(Event)

    StageEventProxy(QFutureWatcherBase& watcher, std::chrono::milliseconds deadline, QObject *parent = nullptr)
        : QObject(parent)
    {
        connect(&watcher, &QFutureWatcherBase::finished,
                this, [this] {
                    timer_.stop();
                    emit event(Event::Finished);
                });

        timer_.setSingleShot(true);
        connect(&timer_, &QTimer::timeout,
                this, [this] {
                    emit event(Event::Timeout);
                });
        timer_.start(deadline);
    }

signals:
    void event(StageEventProxy::Event ev);

private:
    QTimer timer_;
};

/*! Wait for a future, but no longer than `deadline`.
 *
 * Returns nullopt if the deadline expired. The work itself is not stopped;
 * it runs to completion in its thread and the result is dropped.
 */
template <typename T>
QCoro::Task<std::optional<T>> awaitWithDeadline(QFuture<T> future, std::chrono::milliseconds deadline)
{
    if (future.isFinished()) {
        co_return future.result();
    }

    QFutureWatcher<T> watcher;
    StageEventProxy proxy{watcher, deadline};
    watcher.setFuture(future);

    const auto ev = co_await qCoro(&proxy, &StageEventProxy::event);
    if (ev == StageEventProxy::Event::Finished) {
        co_return future.result();
    }

    co_return std::nullopt;
}
