#pragma once

#include <functional>

#include <QObject>
#include <QPointer>

namespace phicore::zwemo {

// Host timer facility used for deferred re-evaluations. Tasks run at or
// after the requested time; there is no cancellation.
class ReEvaluationScheduler
{
public:
    using Task = std::function<void()>;

    virtual ~ReEvaluationScheduler() = default;

    virtual bool scheduleAt(qint64 atMs, qint64 nowMs, Task task) = 0;
};

// QTimer based scheduler. Tasks run on the thread of the context object and
// are dropped if the context is destroyed first.
class TimerScheduler final : public ReEvaluationScheduler
{
public:
    explicit TimerScheduler(QObject *context);

    bool scheduleAt(qint64 atMs, qint64 nowMs, Task task) override;

private:
    QPointer<QObject> m_context;
};

} // namespace phicore::zwemo
