// SPDX-FileCopyrightText: 2026 Samer Ali
// SPDX-License-Identifier: GPL-3.0-only

#pragma once

#include "utils/UtilsGlobal.hpp"

#include <QtCore/QMetaObject>
#include <QtCore/QPointer>
#include <QtCore/QRunnable>
#include <QtCore/QString>
#include <QtCore/QThreadPool>
#include <QtCore/Qt>

#include <exception>
#include <optional>
#include <type_traits>
#include <utility>

namespace Utils::Async {

// What a background task produced: a value, or the message of the exception it threw.
template <typename T>
struct TaskOutcome final {
    std::optional<T> value;
    QString error;

    bool ok() const noexcept { return value.has_value(); }
};

namespace detail {

template <typename Result, typename WorkFn, typename DoneFn>
class AsyncRunnable final : public QRunnable
{
public:
    AsyncRunnable(QPointer<QObject> context, WorkFn work, DoneFn done)
        : m_context(std::move(context))
        , m_work(std::move(work))
        , m_done(std::move(done))
    {
    }

    void run() override
    {
        TaskOutcome<Result> outcome;
        try {
            outcome.value.emplace(m_work());
        } catch (const std::exception& e) {
            outcome.error = QString::fromUtf8(e.what());
            if (outcome.error.isEmpty())
                outcome.error = QStringLiteral("Background task failed.");
        } catch (...) {
            outcome.error = QStringLiteral("Background task failed.");
        }

        if (!m_context)
            return;

        QPointer<QObject> guard = m_context;
        auto done = std::move(m_done);
        QMetaObject::invokeMethod(guard.data(),
                                  [guard, done = std::move(done), outcome = std::move(outcome)]() mutable {
                                      if (guard)
                                          done(std::move(outcome));
                                  },
                                  Qt::QueuedConnection);
    }

private:
    QPointer<QObject> m_context;
    WorkFn m_work;
    DoneFn m_done;
};

} // namespace detail

// Runs work() on the pool and hands its TaskOutcome to done() on context's thread.
// The completion is dropped if context is destroyed first. Returns false if nothing was queued.
template <typename Result, typename Work, typename Done>
bool run(QObject* context, Work&& work, Done&& done, QThreadPool* pool = QThreadPool::globalInstance())
{
    static_assert(!std::is_void_v<Result>, "Async::run needs a value-returning task");

    using WorkFn = std::decay_t<Work>;
    using DoneFn = std::decay_t<Done>;

    if (!context || !pool)
        return false;

    auto task = new detail::AsyncRunnable<Result, WorkFn, DoneFn>(
        QPointer<QObject>(context),
        WorkFn(std::forward<Work>(work)),
        DoneFn(std::forward<Done>(done)));
    task->setAutoDelete(true);
    pool->start(task);
    return true;
}

} // namespace Utils::Async
