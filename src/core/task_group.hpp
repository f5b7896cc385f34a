#pragma once

#include "core/result.hpp"

#include <QMetaType>
#include <QObject>
#include <QPointer>
#include <QString>
#include <optional>
#include <vector>

namespace lanpeer {

/**
 * Task - A long-running unit of work driven by the Qt event loop.
 *
 * A task never returns in the normal case. It reports a fatal problem by
 * emitting failed() once; emitting finished() means it stopped on its own.
 * After cancel() a task emits nothing further.
 */
class Task : public QObject {
    Q_OBJECT

public:
    explicit Task(QString name, QObject* parent = nullptr);
    ~Task() override = default;

    [[nodiscard]] const QString& name() const { return name_; }
    [[nodiscard]] bool isStopped() const { return stopped_; }

    /**
     * Begin work. May fail synchronously by calling fail().
     */
    virtual void start() = 0;

    /**
     * Stop all work and release task resources. Idempotent.
     */
    void cancel();

signals:
    void failed(const lanpeer::Error& error);
    void finished();

protected:
    // Emits failed() unless the task already stopped.
    void fail(Error error);

    // Emits finished() unless the task already stopped.
    void complete();

    virtual void on_cancel() = 0;

private:
    QString name_;
    bool stopped_ = false;
};

/**
 * TaskGroup - Fail-fast scope over a set of tasks.
 *
 * The first task to fail or finish cancels every other member, and the
 * group reports that task's error. The group does not own its tasks.
 */
class TaskGroup : public QObject {
    Q_OBJECT

public:
    explicit TaskGroup(QObject* parent = nullptr);
    ~TaskGroup() override;

    void add(Task* task);

    /**
     * Start members in insertion order. Stops early if one fails while starting.
     */
    void start();

    /**
     * Cancel all members without reporting an error.
     */
    void cancel();

    [[nodiscard]] bool isRunning() const { return running_; }
    [[nodiscard]] const std::optional<Error>& error() const { return error_; }

signals:
    void failed(const lanpeer::Error& error);

private:
    void onTaskFailed(Task* task, const Error& error);
    void cancelAll();

    std::vector<QPointer<Task>> tasks_;
    std::optional<Error> error_;
    bool running_ = false;
};

} // namespace lanpeer

Q_DECLARE_METATYPE(lanpeer::Error)
