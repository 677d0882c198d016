#include "reevaluationscheduler.h"

#include <limits>

#include <QTimer>

namespace phicore::zwemo {

TimerScheduler::TimerScheduler(QObject *context)
    : m_context(context)
{
}

bool TimerScheduler::scheduleAt(qint64 atMs, qint64 nowMs, Task task)
{
    if (!m_context || !task)
        return false;
    const qint64 delayMs = qBound<qint64>(0, atMs - nowMs, std::numeric_limits<int>::max());
    // Precise timers do not fire early, coarse ones may by up to 5%.
    QTimer::singleShot(static_cast<int>(delayMs), Qt::PreciseTimer, m_context.data(), std::move(task));
    return true;
}

} // namespace phicore::zwemo
