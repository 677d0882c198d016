#include "subscriptionregistry.h"

#include <QDateTime>
#include <QMutexLocker>
#include <QPointer>

#include "corelog.h"

namespace phicore::zwemo {

SubscriptionRegistry::SubscriptionRegistry(QObject *parent)
    : QObject(parent)
    , m_timerScheduler(std::make_unique<TimerScheduler>(this))
    , m_clock([]() { return QDateTime::currentMSecsSinceEpoch(); })
{
    m_scheduler = m_timerScheduler.get();
}

SubscriptionRegistry::~SubscriptionRegistry()
{
    stop();
}

bool SubscriptionRegistry::start()
{
    QMutexLocker locker(&m_mutex);
    if (m_state == State::Running)
        return true;
    if (m_state == State::Stopped) {
        qCWarning(zwemoCoreLog) << "Subscription registry cannot be restarted after stop()";
        return false;
    }
    m_state = State::Running;
    qCInfo(zwemoCoreLog) << "Subscription registry started";
    return true;
}

void SubscriptionRegistry::stop()
{
    {
        QMutexLocker locker(&m_mutex);
        if (m_state != State::Running)
            return;
        m_state = State::Stopped;
        m_entries.clear();
    }
    qCInfo(zwemoCoreLog) << "Shutting down subscriptions.";
    emit stopped();
}

SubscriptionRegistry::State SubscriptionRegistry::state() const
{
    QMutexLocker locker(&m_mutex);
    return m_state;
}

bool SubscriptionRegistry::subscribe(const QString &key, Callback callback)
{
    if (key.isEmpty() || !callback)
        return false;
    QMutexLocker locker(&m_mutex);
    if (m_state == State::Stopped)
        return false;
    if (m_entries.contains(key))
        return false;
    m_entries.insert(key, std::move(callback));
    return true;
}

bool SubscriptionRegistry::isSubscribed(const QString &key) const
{
    QMutexLocker locker(&m_mutex);
    return m_entries.contains(key);
}

int SubscriptionRegistry::subscriptionCount() const
{
    QMutexLocker locker(&m_mutex);
    return static_cast<int>(m_entries.size());
}

bool SubscriptionRegistry::scheduleReEvaluation(const QString &key, qint64 atMs)
{
    ReEvaluationScheduler *scheduler = nullptr;
    {
        QMutexLocker locker(&m_mutex);
        if (m_state != State::Running) {
            qCWarning(zwemoCoreLog) << "Re-evaluation for" << key << "not scheduled: registry not running";
            return false;
        }
        scheduler = m_scheduler;
    }
    if (!scheduler) {
        qCWarning(zwemoCoreLog) << "Re-evaluation for" << key << "not scheduled: no scheduler";
        return false;
    }

    QPointer<SubscriptionRegistry> self(this);
    const bool ok = scheduler->scheduleAt(atMs, now(), [self, key]() {
        if (!self)
            return;
        self->dispatch(Notification::reEvaluate(key, self->now()));
    });
    if (!ok)
        qCWarning(zwemoCoreLog) << "Re-evaluation for" << key << "could not be scheduled";
    return ok;
}

void SubscriptionRegistry::setScheduler(ReEvaluationScheduler *scheduler)
{
    QMutexLocker locker(&m_mutex);
    m_scheduler = scheduler ? scheduler : m_timerScheduler.get();
}

void SubscriptionRegistry::setClock(Clock clock)
{
    QMutexLocker locker(&m_mutex);
    if (clock)
        m_clock = std::move(clock);
    else
        m_clock = []() { return QDateTime::currentMSecsSinceEpoch(); };
}

qint64 SubscriptionRegistry::now() const
{
    Clock clock;
    {
        QMutexLocker locker(&m_mutex);
        clock = m_clock;
    }
    return clock();
}

void SubscriptionRegistry::dispatch(const Notification &notification)
{
    Callback callback;
    {
        QMutexLocker locker(&m_mutex);
        if (m_state != State::Running)
            return;
        const auto it = m_entries.constFind(notification.key);
        if (it == m_entries.constEnd())
            return;
        callback = it.value();
    }
    callback(notification);
}

SubscriptionRegistry *ensureRunningRegistry(QPointer<SubscriptionRegistry> &registry, QObject *owner)
{
    if (registry && registry->state() == SubscriptionRegistry::State::Stopped) {
        registry->deleteLater();
        registry = nullptr;
    }
    if (!registry)
        registry = new SubscriptionRegistry(owner);
    registry->start();
    return registry;
}

} // namespace phicore::zwemo
