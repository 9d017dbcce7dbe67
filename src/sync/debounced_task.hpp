#pragma once

#include <QObject>

#include <functional>
#include <memory>

class QTimer;

namespace folio::sync {

/**
 * DebouncedTask - single-shot deferred work that a newer schedule() replaces.
 *
 * cancel() is a pure no-op on the work: nothing partial runs. A fired task
 * whose generation is stale does nothing.
 */
class DebouncedTask : public QObject {
    Q_OBJECT

public:
    explicit DebouncedTask(QObject* parent = nullptr);
    ~DebouncedTask() override;

    void schedule(int delay_ms, std::function<void()> work);
    void cancel();

    [[nodiscard]] bool is_pending() const;

private:
    void fire(quint64 generation);

    std::unique_ptr<QTimer> timer_;
    std::function<void()> work_;
    quint64 generation_ = 0;
};

} // namespace folio::sync
