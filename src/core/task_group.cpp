#include "core/task_group.hpp"

namespace lanpeer {

// ============================================================================
// Task
// ============================================================================

Task::Task(QString name, QObject* parent)
    : QObject(parent)
    , name_(std::move(name))
{
}

void Task::cancel() {
    if (stopped_) return;
    stopped_ = true;
    on_cancel();
}

void Task::fail(Error error) {
    if (stopped_) return;
    emit failed(error);
}

void Task::complete() {
    if (stopped_) return;
    emit finished();
}

// ============================================================================
// TaskGroup
// ============================================================================

TaskGroup::TaskGroup(QObject* parent)
    : QObject(parent)
{
}

TaskGroup::~TaskGroup() {
    cancelAll();
}

void TaskGroup::add(Task* task) {
    tasks_.push_back(task);

    connect(task, &Task::failed, this, [this, task](const Error& error) {
        onTaskFailed(task, error);
    });
    connect(task, &Task::finished, this, [this, task]() {
        onTaskFailed(task, Error{"task completed unexpectedly",
                                 ErrorCode::UnexpectedCompletion});
    });
}

void TaskGroup::start() {
    running_ = true;
    for (const auto& task : tasks_) {
        if (!running_) break;
        if (task) task->start();
    }
}

void TaskGroup::cancel() {
    running_ = false;
    cancelAll();
}

void TaskGroup::onTaskFailed(Task* task, const Error& error) {
    if (!running_ || error_) return;

    running_ = false;
    error_ = Error{task->name().toStdString() + ": " + error.message, error.code};
    cancelAll();
    emit failed(*error_);
}

void TaskGroup::cancelAll() {
    for (const auto& task : tasks_) {
        if (task) task->cancel();
    }
}

} // namespace lanpeer
