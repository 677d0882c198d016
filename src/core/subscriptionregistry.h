#pragma once

#include <functional>
#include <memory>

#include <QHash>
#include <QMutex>
#include <QObject>
#include <QPointer>

#include "notification.h"
#include "reevaluationscheduler.h"

namespace phicore::zwemo {

// Routes notifications to the device handle subscribed under the
// notification's key. One instance per adapter; started once, stopped once,
// not restartable.
//
// The entry table is mutex guarded. Callbacks run outside the lock, so a
// callback may subscribe or schedule a re-evaluation itself.
class SubscriptionRegistry : public QObject
{
    Q_OBJECT

public:
    using Callback = std::function<void(const Notification &)>;
    using Clock = std::function<qint64()>;

    enum class State {
        Idle = 0,
        Running,
        Stopped
    };
    Q_ENUM(State)

    explicit SubscriptionRegistry(QObject *parent = nullptr);
    ~SubscriptionRegistry() override;

    bool start();
    void stop();
    State state() const;
    bool isRunning() const { return state() == State::Running; }

    // Returns false (and keeps the existing entry) if the key is taken.
    bool subscribe(const QString &key, Callback callback);
    bool isSubscribed(const QString &key) const;
    int subscriptionCount() const;

    // Posts a ReEvaluate notification for key into dispatch() at or after atMs.
    bool scheduleReEvaluation(const QString &key, qint64 atMs);

    // Not owned. nullptr restores the built-in QTimer scheduler.
    void setScheduler(ReEvaluationScheduler *scheduler);
    void setClock(Clock clock);
    qint64 now() const;

public slots:
    void dispatch(const phicore::zwemo::Notification &notification);

signals:
    void stopped();

private:
    mutable QMutex m_mutex;
    State m_state = State::Idle;
    QHash<QString, Callback> m_entries;
    std::unique_ptr<TimerScheduler> m_timerScheduler;
    ReEvaluationScheduler *m_scheduler = nullptr;
    Clock m_clock;
};

// Starts registry, first replacing it with a new one owned by owner when it
// is missing or already stopped.
SubscriptionRegistry *ensureRunningRegistry(QPointer<SubscriptionRegistry> &registry, QObject *owner);

} // namespace phicore::zwemo
