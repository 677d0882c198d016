#include <gtest/gtest.h>

#include "zwave_fixtures.h"
#include "zwavenodestate.h"

using namespace phicore::zwemo;
using namespace phicore::zwemo::zwave;

namespace {

const QString kMotion = QStringLiteral("7-48-0-Motion");
const QString kTemperature = QStringLiteral("7-49-0-Air temperature");
const QString kMotionStatus = QStringLiteral("7-113-0-Home Security-Motion sensor status");

ZWaveNode philioNode()
{
    QList<ZWaveNode> nodes;
    QString error;
    parseNodeList(zwemo_test::kGetNodesResponse, nodes, error);
    return nodes.value(0);
}

Notification valueChanged(const QString &valueId, const QVariant &payload, qint64 nowMs)
{
    Notification notification;
    notification.key = valueId;
    notification.payload = payload;
    notification.tsMs = nowMs;
    return notification;
}

PendingValue pendingValue(int nodeId, const QString &valueId, const QByteArray &payload)
{
    PendingValue value;
    value.topic.nodeId = nodeId;
    value.topic.valueId = valueId;
    value.payload = payload;
    return value;
}

}

TEST(ZWaveNodeStateTest, BuildsSensorsInValueOrder)
{
    const ZWaveNodeState state = ZWaveNodeState::build(philioNode());
    EXPECT_EQ(state.nodeId(), 7);
    EXPECT_EQ(state.valueIds(), QStringList({ kMotion, kTemperature, kMotionStatus }));
    EXPECT_EQ(state.sensor(QStringLiteral("7-128-0-level")), nullptr);
    ASSERT_NE(state.sensor(kTemperature), nullptr);
    EXPECT_EQ(state.sensor(kTemperature)->variant(), SensorVariant::MultilevelSensor);
}

TEST(ZWaveNodeStateTest, InitialStatesCoverValuesAndTriggers)
{
    ZWaveNodeState state = ZWaveNodeState::build(philioNode());
    const auto initial = state.takeInitialStates(1000);
    ASSERT_EQ(initial.size(), 3);
    EXPECT_EQ(initial.at(0).first, kMotion);
    EXPECT_EQ(initial.at(0).second.kind, CanonicalState::Kind::Off);
    EXPECT_EQ(initial.at(1).first, kTemperature);
    EXPECT_DOUBLE_EQ(initial.at(1).second.value.toDouble(), 71.6);
    ASSERT_TRUE(state.lastPushed(kTemperature).has_value());
}

TEST(ZWaveNodeStateTest, BatteryLevelReachesEverySensor)
{
    ZWaveNodeState state = ZWaveNodeState::build(philioNode());
    EXPECT_EQ(state.attributes().value(QStringLiteral("battery_level")).toInt(), 90);

    EXPECT_FALSE(state.applyBatteryLevel(90));
    EXPECT_FALSE(state.applyBatteryLevel(QStringLiteral("low")));
    EXPECT_TRUE(state.applyBatteryLevel(55));

    EXPECT_EQ(state.node().batteryLevel, 55);
    EXPECT_EQ(state.attributes().value(QStringLiteral("battery_level")).toInt(), 55);
    for (const QString &valueId : state.valueIds())
        EXPECT_EQ(state.sensor(valueId)->attributes().value(QStringLiteral("battery_level")).toInt(), 55);
}

TEST(ZWaveNodeStateTest, RebuildKeepsTriggerWindowAndLastPush)
{
    ZWaveNodeState state = ZWaveNodeState::build(philioNode());
    state.takeInitialStates(1000);
    const SensorUpdate update = state.handleNotification(kMotion, valueChanged(kMotion, true, 1000));
    ASSERT_TRUE(update.push.has_value());
    EXPECT_EQ(update.push->kind, CanonicalState::Kind::On);
    // Configuration parameter 9 is 3: a 24 s window.
    EXPECT_EQ(update.reEvaluateAtMs, 25000);

    ZWaveNode renamed = philioNode();
    renamed.location = QStringLiteral("Attic");
    const ZWaveNodeState rebuilt = ZWaveNodeState::build(renamed, &state);
    EXPECT_EQ(rebuilt.sensor(kMotion)->triggerWindow().expiresAtMs(), 25000);
    EXPECT_EQ(rebuilt.sensor(kMotion)->computeState(2000).kind, CanonicalState::Kind::On);
    EXPECT_EQ(rebuilt.lastPushed(kMotion), CanonicalState::on());
    EXPECT_EQ(rebuilt.attributes().value(QStringLiteral("location")).toString(), QStringLiteral("Attic"));
}

TEST(ZWaveNodeStateTest, ReEvaluationPushesOnlyChangedOffState)
{
    ZWaveNodeState state = ZWaveNodeState::build(philioNode());
    state.takeInitialStates(1000);
    state.handleNotification(kMotion, valueChanged(kMotion, true, 1000));

    EXPECT_FALSE(state.handleNotification(kMotion, Notification::reEvaluate(kMotion, 20000)).push.has_value());

    const SensorUpdate expired = state.handleNotification(kMotion, Notification::reEvaluate(kMotion, 25000));
    ASSERT_TRUE(expired.push.has_value());
    EXPECT_EQ(expired.push->kind, CanonicalState::Kind::Off);
    EXPECT_FALSE(expired.reEvaluateAtMs.has_value());

    EXPECT_FALSE(state.handleNotification(kMotion, Notification::reEvaluate(kMotion, 40000)).push.has_value());
}

TEST(ZWaveNodeStateTest, UnknownValueIdIsIgnored)
{
    ZWaveNodeState state = ZWaveNodeState::build(philioNode());
    const QString battery = QStringLiteral("7-128-0-level");
    const SensorUpdate update = state.handleNotification(battery, valueChanged(battery, 40, 1000));
    EXPECT_FALSE(update.push.has_value());
    EXPECT_FALSE(update.reEvaluateAtMs.has_value());
}

TEST(ValueBacklogTest, ReplaysLatestValueOnceNodeIsKnown)
{
    ValueBacklog backlog;
    EXPECT_TRUE(backlog.hold(pendingValue(7, kTemperature, QByteArrayLiteral("70.1"))));
    EXPECT_TRUE(backlog.hold(pendingValue(7, kTemperature, QByteArrayLiteral("70.5"))));
    EXPECT_TRUE(backlog.hold(pendingValue(9, QStringLiteral("9-49-0-Air temperature"), QByteArrayLiteral("20"))));
    EXPECT_EQ(backlog.size(), 2);

    const QList<PendingValue> taken = backlog.take(ZWaveNodeState::build(philioNode()).valueIds());
    ASSERT_EQ(taken.size(), 1);
    EXPECT_EQ(taken.first().payload, QByteArrayLiteral("70.5"));
    EXPECT_EQ(backlog.size(), 1);
    EXPECT_TRUE(backlog.take({ kTemperature }).isEmpty());
}

TEST(ValueBacklogTest, NodesListedWithoutSensorsAreNotBuffered)
{
    ValueBacklog backlog;
    const QString switchValue = QStringLiteral("4-37-0-currentValue");
    EXPECT_TRUE(backlog.hold(pendingValue(4, switchValue, QByteArrayLiteral("true"))));
    EXPECT_TRUE(backlog.hold(pendingValue(5, QStringLiteral("5-49-0-Humidity"), QByteArrayLiteral("40"))));

    backlog.setListedNodes({ 4, 7 });
    EXPECT_EQ(backlog.size(), 1);
    EXPECT_TRUE(backlog.isListed(4));

    for (int i = 0; i < 100; ++i)
        EXPECT_FALSE(backlog.hold(pendingValue(4, switchValue, QByteArrayLiteral("false"))));
    EXPECT_EQ(backlog.size(), 1);

    backlog.clear();
    EXPECT_EQ(backlog.size(), 0);
    EXPECT_FALSE(backlog.isListed(4));
}
