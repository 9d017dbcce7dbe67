#include "sync/debounced_task.hpp"

#include <QTimer>

namespace folio::sync {

DebouncedTask::DebouncedTask(QObject* parent)
    : QObject(parent)
    , timer_(std::make_unique<QTimer>()) {
    timer_->setSingleShot(true);
}

DebouncedTask::~DebouncedTask() = default;

void DebouncedTask::schedule(int delay_ms, std::function<void()> work) {
    cancel();
    work_ = std::move(work);
    const auto generation = ++generation_;
    timer_->disconnect(this);
    connect(timer_.get(), &QTimer::timeout, this, [this, generation]() { fire(generation); });
    timer_->start(delay_ms);
}

void DebouncedTask::cancel() {
    timer_->stop();
    ++generation_;
    work_ = nullptr;
}

bool DebouncedTask::is_pending() const {
    return timer_->isActive();
}

void DebouncedTask::fire(quint64 generation) {
    if (generation != generation_ || !work_) {
        return;
    }
    // Move out first: the work may reschedule this task.
    auto work = std::move(work_);
    work_ = nullptr;
    work();
}

} // namespace folio::sync
