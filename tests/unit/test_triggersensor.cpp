#include <gtest/gtest.h>

#include <vector>

#include "subscriptionregistry.h"
#include "zwavenodestate.h"
#include "zwavesensor.h"

using namespace phicore::zwemo;
using namespace phicore::zwemo::zwave;

namespace {

// Collects re-evaluations and runs them when the test advances time.
class ManualScheduler : public ReEvaluationScheduler
{
public:
    bool scheduleAt(qint64 atMs, qint64 nowMs, Task task) override
    {
        Q_UNUSED(nowMs);
        m_pending.push_back({ atMs, std::move(task) });
        return true;
    }

    int runDue(qint64 nowMs)
    {
        std::vector<Entry> due;
        for (auto it = m_pending.begin(); it != m_pending.end();) {
            if (it->atMs <= nowMs) {
                due.push_back(std::move(*it));
                it = m_pending.erase(it);
            } else {
                ++it;
            }
        }
        for (Entry &entry : due)
            entry.task();
        return static_cast<int>(due.size());
    }

    int pendingCount() const { return static_cast<int>(m_pending.size()); }

private:
    struct Entry {
        qint64 atMs;
        Task task;
    };
    std::vector<Entry> m_pending;
};

ZWaveNode philioNode(const QVariant &reArmMultiplier = QVariant())
{
    ZWaveNode node;
    node.nodeId = 7;
    node.manufacturerId = 0x013c;
    node.productId = 0x0002;
    node.name = QStringLiteral("Hallway");
    if (reArmMultiplier.isValid())
        node.configuration.insert(kReArmConfigParameter, reArmMultiplier);
    return node;
}

ZWaveValue motionValue()
{
    ZWaveValue value;
    value.nodeId = 7;
    value.commandClass = CommandClass::SensorBinary;
    value.endpoint = 0;
    value.property = QStringLiteral("Motion");
    value.type = QStringLiteral("boolean");
    value.label = QStringLiteral("Motion");
    value.valueId = makeValueId(7, CommandClass::SensorBinary, 0, value.property);
    return value;
}

ZWaveNode philioNodeWithMotion()
{
    ZWaveNode node = philioNode();
    node.values.append(motionValue());
    return node;
}

}

// Drives a Philio node through the registry the way the Z-Wave adapter does:
// the node state decides, the fixture only schedules and records pushes.
class TriggerSensorTest : public ::testing::Test
{
protected:
    void SetUp() override
    {
        registry.setScheduler(&scheduler);
        registry.setClock([this]() { return nowMs; });
        ASSERT_TRUE(registry.start());

        node = ZWaveNodeState::build(philioNodeWithMotion());
        ASSERT_EQ(node.valueIds().size(), 1);
        valueId = node.valueIds().first();
        ASSERT_EQ(sensor().variant(), SensorVariant::TriggerWorkaround);
        ASSERT_EQ(node.takeInitialStates(nowMs).size(), 1);

        registry.subscribe(valueId, [this](const Notification &notification) {
            const SensorUpdate update = node.handleNotification(valueId, notification);
            if (update.reEvaluateAtMs)
                registry.scheduleReEvaluation(valueId, *update.reEvaluateAtMs);
            if (update.push)
                pushed.push_back(*update.push);
        });
    }

    const ZWaveSensor &sensor() const { return *node.sensor(valueId); }

    void sendValue(const QVariant &value, bool retained = false, qint64 sourceTsMs = 0)
    {
        Notification notification;
        notification.key = valueId;
        notification.payload = value;
        notification.tsMs = nowMs;
        notification.retained = retained;
        notification.sourceTsMs = sourceTsMs;
        registry.dispatch(notification);
    }

    void advanceTo(qint64 ms)
    {
        nowMs = ms;
        scheduler.runDue(ms);
    }

    qint64 nowMs = 1000000;
    ManualScheduler scheduler;
    SubscriptionRegistry registry;
    ZWaveNodeState node;
    QString valueId;
    std::vector<CanonicalState> pushed;
};

TEST_F(TriggerSensorTest, StartsArmed)
{
    EXPECT_EQ(sensor().computeState(nowMs).kind, CanonicalState::Kind::Off);
    EXPECT_EQ(sensor().triggerWindow().reArmSeconds(), 32);
}

TEST_F(TriggerSensorTest, OnHoldsForReArmWindowThenTurnsOff)
{
    const qint64 t0 = nowMs;
    sendValue(true);

    ASSERT_EQ(pushed.size(), 1u);
    EXPECT_EQ(pushed.back().kind, CanonicalState::Kind::On);
    EXPECT_EQ(sensor().triggerWindow().expiresAtMs(), t0 + 32000);
    EXPECT_GT(sensor().triggerWindow().expiresAtMs(), nowMs);
    EXPECT_EQ(scheduler.pendingCount(), 1);

    advanceTo(t0 + 31999);
    EXPECT_EQ(sensor().computeState(nowMs).kind, CanonicalState::Kind::On);
    EXPECT_EQ(pushed.size(), 1u);

    advanceTo(t0 + 32000);
    ASSERT_EQ(pushed.size(), 2u);
    EXPECT_EQ(pushed.back().kind, CanonicalState::Kind::Off);
    EXPECT_EQ(sensor().computeState(t0 + 32001).kind, CanonicalState::Kind::Off);
}

TEST_F(TriggerSensorTest, RepeatedOnExtendsWindowMonotonically)
{
    const qint64 t0 = nowMs;
    sendValue(true);
    const qint64 firstExpiry = sensor().triggerWindow().expiresAtMs();

    advanceTo(t0 + 20000);
    sendValue(true);
    const qint64 secondExpiry = sensor().triggerWindow().expiresAtMs();
    EXPECT_GT(secondExpiry, firstExpiry);
    EXPECT_EQ(secondExpiry, t0 + 52000);

    // The first re-evaluation fires inside the extended window: no-op.
    advanceTo(t0 + 32000);
    for (const CanonicalState &state : pushed)
        EXPECT_EQ(state.kind, CanonicalState::Kind::On);
    EXPECT_EQ(sensor().computeState(nowMs).kind, CanonicalState::Kind::On);

    advanceTo(t0 + 52000);
    EXPECT_EQ(pushed.back().kind, CanonicalState::Kind::Off);
}

TEST_F(TriggerSensorTest, EarlierTimestampNeverShortensWindow)
{
    const qint64 t0 = nowMs;
    sendValue(true);
    nowMs = t0 - 5000;
    sendValue(true);
    EXPECT_EQ(sensor().triggerWindow().expiresAtMs(), t0 + 32000);
}

TEST_F(TriggerSensorTest, OffNotificationRearmsImmediately)
{
    const qint64 t0 = nowMs;
    sendValue(true);
    advanceTo(t0 + 5000);
    sendValue(false);

    ASSERT_EQ(pushed.size(), 2u);
    EXPECT_EQ(pushed.back().kind, CanonicalState::Kind::Off);
    EXPECT_EQ(sensor().triggerWindow().expiresAtMs(), 0);

    // The stale re-evaluation finds the sensor already off.
    advanceTo(t0 + 32000);
    EXPECT_EQ(pushed.size(), 2u);
}

TEST_F(TriggerSensorTest, MissedReEvaluationLeavesStateTriggeredInWindowOnly)
{
    const qint64 t0 = nowMs;
    sendValue(true);
    // Nothing runs the scheduler; the live recompute still expires the window.
    EXPECT_EQ(sensor().computeState(t0 + 40000).kind, CanonicalState::Kind::Off);
    EXPECT_EQ(pushed.size(), 1u);
}

TEST_F(TriggerSensorTest, ReEvaluationAfterOffPushesNothing)
{
    const qint64 t0 = nowMs;
    sendValue(true);
    advanceTo(t0 + 32000);
    ASSERT_EQ(pushed.size(), 2u);

    // A second, superseded re-evaluation finds the state already pushed.
    registry.dispatch(Notification::reEvaluate(valueId, t0 + 40000));
    EXPECT_EQ(pushed.size(), 2u);
}

TEST_F(TriggerSensorTest, RetainedValueWithoutTimeOpensNoWindow)
{
    sendValue(true, true);
    ASSERT_EQ(pushed.size(), 1u);
    EXPECT_EQ(pushed.back().kind, CanonicalState::Kind::Off);
    EXPECT_EQ(sensor().triggerWindow().expiresAtMs(), 0);
    EXPECT_EQ(scheduler.pendingCount(), 0);

    // A live trigger afterwards behaves as usual.
    sendValue(true);
    EXPECT_EQ(pushed.back().kind, CanonicalState::Kind::On);
    EXPECT_EQ(scheduler.pendingCount(), 1);
}

TEST_F(TriggerSensorTest, RetainedValueDoesNotCloseAnOpenWindow)
{
    const qint64 t0 = nowMs;
    sendValue(true);
    advanceTo(t0 + 10000);
    sendValue(true, true);
    EXPECT_EQ(pushed.back().kind, CanonicalState::Kind::On);
    EXPECT_EQ(sensor().triggerWindow().expiresAtMs(), t0 + 32000);
}

TEST_F(TriggerSensorTest, StaleTimestampedValueStaysOff)
{
    // Replayed "true" from an hour ago.
    sendValue(true, true, nowMs - 3600000);
    ASSERT_EQ(pushed.size(), 1u);
    EXPECT_EQ(pushed.back().kind, CanonicalState::Kind::Off);
    EXPECT_EQ(scheduler.pendingCount(), 0);
}

TEST_F(TriggerSensorTest, WindowIsAnchoredAtSourceTime)
{
    const qint64 t0 = nowMs;
    sendValue(true, false, t0 - 10000);
    ASSERT_EQ(pushed.size(), 1u);
    EXPECT_EQ(pushed.back().kind, CanonicalState::Kind::On);
    EXPECT_EQ(sensor().triggerWindow().expiresAtMs(), t0 + 22000);

    advanceTo(t0 + 22000);
    ASSERT_EQ(pushed.size(), 2u);
    EXPECT_EQ(pushed.back().kind, CanonicalState::Kind::Off);
}

TEST_F(TriggerSensorTest, FutureSourceTimeIsClampedToNow)
{
    const qint64 t0 = nowMs;
    sendValue(true, false, t0 + 600000);
    EXPECT_EQ(sensor().triggerWindow().expiresAtMs(), t0 + 32000);
}

TEST(TriggerWindowTest, ReArmSecondsFromConfigurationParameter)
{
    std::optional<ZWaveSensor> sensor = ZWaveSensor::create(philioNode(2), motionValue());
    ASSERT_TRUE(sensor.has_value());
    EXPECT_EQ(sensor->triggerWindow().reArmSeconds(), 16);

    sensor = ZWaveSensor::create(philioNode(0), motionValue());
    ASSERT_TRUE(sensor.has_value());
    EXPECT_EQ(sensor->triggerWindow().reArmSeconds(), 32);

    sensor = ZWaveSensor::create(philioNode(QStringLiteral("fast")), motionValue());
    ASSERT_TRUE(sensor.has_value());
    EXPECT_EQ(sensor->triggerWindow().reArmSeconds(), 32);
}

TEST(TriggerWindowTest, TriggerAndReset)
{
    TriggerWindow window(8);
    EXPECT_FALSE(window.isTriggered(0));
    EXPECT_EQ(window.trigger(1000), 9000);
    EXPECT_TRUE(window.isTriggered(8999));
    EXPECT_FALSE(window.isTriggered(9000));
    window.reset();
    EXPECT_FALSE(window.isTriggered(1000));
}
