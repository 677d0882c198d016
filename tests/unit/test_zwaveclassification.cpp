#include <gtest/gtest.h>

#include "zwave_fixtures.h"
#include "zwavesensor.h"

using namespace phicore::zwemo;
using namespace phicore::zwemo::zwave;

namespace {

ZWaveNode makeNode(int manufacturerId, int productId)
{
    ZWaveNode node;
    node.nodeId = 12;
    node.manufacturerId = manufacturerId;
    node.productId = productId;
    node.manufacturer = QStringLiteral("Aeotec");
    node.product = QStringLiteral("MultiSensor 6");
    return node;
}

ZWaveValue makeValue(int commandClass, const QString &property, const QString &type = QString(),
                     const QString &propertyKey = QString())
{
    ZWaveValue value;
    value.nodeId = 12;
    value.commandClass = commandClass;
    value.property = property;
    value.propertyKey = propertyKey;
    value.label = propertyKey.isEmpty() ? property : propertyKey;
    value.type = type;
    value.valueId = makeValueId(12, commandClass, 0, property, propertyKey);
    return value;
}

}

TEST(ZWaveClassificationTest, CommandClassRules)
{
    const ZWaveNode node = makeNode(0x0086, 0x0064);
    EXPECT_EQ(classifyValue(node, makeValue(CommandClass::SensorBinary, QStringLiteral("Any"))),
              SensorVariant::BinarySensor);
    EXPECT_EQ(classifyValue(node, makeValue(CommandClass::SensorMultilevel, QStringLiteral("Air temperature"))),
              SensorVariant::MultilevelSensor);
    EXPECT_EQ(classifyValue(node, makeValue(CommandClass::Alarm, QStringLiteral("Home Security"))),
              SensorVariant::AlarmSensor);
}

TEST(ZWaveClassificationTest, MeterNeedsDecimalType)
{
    const ZWaveNode node = makeNode(0x0086, 0x0064);
    EXPECT_EQ(classifyValue(node, makeValue(CommandClass::Meter, QStringLiteral("value"), QStringLiteral("number"))),
              SensorVariant::MultilevelSensor);
    EXPECT_FALSE(classifyValue(node, makeValue(CommandClass::Meter, QStringLiteral("reset"), QStringLiteral("boolean"))));
}

TEST(ZWaveClassificationTest, UnknownCommandClassIsSkipped)
{
    const ZWaveNode node = makeNode(0x0086, 0x0064);
    EXPECT_FALSE(classifyValue(node, makeValue(0x25, QStringLiteral("currentValue"))));
    EXPECT_FALSE(classifyValue(node, makeValue(CommandClass::Battery, QStringLiteral("level"))));
    EXPECT_FALSE(ZWaveSensor::create(node, makeValue(0x25, QStringLiteral("currentValue"))).has_value());
}

TEST(ZWaveClassificationTest, WorkaroundTableWinsOverCommandClass)
{
    const ZWaveNode philio = makeNode(0x013c, 0x0002);
    EXPECT_EQ(classifyValue(philio, makeValue(CommandClass::SensorBinary, QStringLiteral("Motion"),
                                              QStringLiteral("boolean"))),
              SensorVariant::TriggerWorkaround);
    EXPECT_EQ(classifyValue(philio, makeValue(CommandClass::Alarm, QStringLiteral("Home Security"),
                                              QStringLiteral("number"), QStringLiteral("Motion sensor status"))),
              SensorVariant::TriggerWorkaround);
    // Other values of the same node follow the command class rules.
    EXPECT_EQ(classifyValue(philio, makeValue(CommandClass::Alarm, QStringLiteral("Home Security"),
                                              QStringLiteral("number"), QStringLiteral("Cover status"))),
              SensorVariant::AlarmSensor);
    EXPECT_EQ(classifyValue(philio, makeValue(CommandClass::SensorMultilevel, QStringLiteral("Illuminance"),
                                              QStringLiteral("number"))),
              SensorVariant::MultilevelSensor);
}

TEST(ZWaveClassificationTest, WorkaroundLookup)
{
    const ZWaveValue motion = makeValue(CommandClass::SensorBinary, QStringLiteral("Motion"));
    EXPECT_EQ(lookupWorkaround(0x013c, 0x0002, motion), Workaround::TriggerNoOffEvent);
    EXPECT_EQ(lookupWorkaround(0x013c, 0x0003, motion), Workaround::None);
    EXPECT_EQ(lookupWorkaround(0x013c, 0x0002, makeValue(CommandClass::SensorBinary, QStringLiteral("Door"))),
              Workaround::None);
    // A matching property under a non-sensor command class never matches.
    EXPECT_EQ(lookupWorkaround(0x013c, 0x0002, makeValue(CommandClass::Configuration, QStringLiteral("Motion"))),
              Workaround::None);
}

TEST(ZWaveClassificationTest, OnlyMotionValuesOfPhilioNodeUseWorkaround)
{
    QList<ZWaveNode> nodes;
    QString error;
    ASSERT_TRUE(parseNodeList(zwemo_test::kGetNodesResponse, nodes, error)) << error.toStdString();
    ASSERT_EQ(nodes.size(), 1);
    const ZWaveNode &node = nodes.first();
    ASSERT_EQ(node.values.size(), 5);

    QHash<QString, std::optional<SensorVariant>> variants;
    for (const ZWaveValue &value : node.values)
        variants.insert(value.valueId, classifyValue(node, value));

    EXPECT_EQ(variants.value(QStringLiteral("7-48-0-Motion")), SensorVariant::TriggerWorkaround);
    EXPECT_EQ(variants.value(QStringLiteral("7-113-0-Home Security-Motion sensor status")),
              SensorVariant::TriggerWorkaround);
    EXPECT_EQ(variants.value(QStringLiteral("7-49-0-Air temperature")), SensorVariant::MultilevelSensor);
    EXPECT_FALSE(variants.value(QStringLiteral("7-128-0-level")).has_value());
    EXPECT_FALSE(variants.value(QStringLiteral("7-112-0-9")).has_value());
}

TEST(ZWaveClassificationTest, PhilioTemperatureReadingIsNotATrigger)
{
    QList<ZWaveNode> nodes;
    QString error;
    ASSERT_TRUE(parseNodeList(zwemo_test::kGetNodesResponse, nodes, error));
    const ZWaveNode &node = nodes.first();

    std::optional<ZWaveSensor> temperature = ZWaveSensor::create(node, node.values.at(1));
    ASSERT_TRUE(temperature.has_value());
    EXPECT_EQ(temperature->variant(), SensorVariant::MultilevelSensor);
    EXPECT_FALSE(temperature->applyValue(71.6, 1000).has_value());

    const CanonicalState state = temperature->computeState(1000);
    ASSERT_TRUE(state.isNumeric());
    EXPECT_DOUBLE_EQ(state.value.toDouble(), 71.6);
    EXPECT_EQ(temperature->unit(), QStringLiteral("°F"));
}

TEST(ZWaveClassificationTest, ReArmSecondsForNode)
{
    ZWaveNode node = makeNode(0x013c, 0x0002);
    EXPECT_EQ(reArmSecondsForNode(node), 32);
    node.configuration.insert(kReArmConfigParameter, 6);
    EXPECT_EQ(reArmSecondsForNode(node), 48);
    node.configuration.insert(kReArmConfigParameter, -1);
    EXPECT_EQ(reArmSecondsForNode(node), 32);
}

TEST(ZWaveClassificationTest, SensorNamingAndAttributes)
{
    ZWaveNode node = makeNode(0x0086, 0x0064);
    node.batteryLevel = 87;
    node.location = QStringLiteral("Kitchen");
    ZWaveValue value = makeValue(CommandClass::SensorMultilevel, QStringLiteral("Air temperature"),
                                 QStringLiteral("number"));
    value.unit = QStringLiteral("C");
    value.value = 21.266;

    const std::optional<ZWaveSensor> sensor = ZWaveSensor::create(node, value);
    ASSERT_TRUE(sensor.has_value());
    EXPECT_EQ(sensor->name(), QStringLiteral("Aeotec MultiSensor 6 Air temperature"));
    EXPECT_EQ(sensor->uniqueId(), QStringLiteral("ZWAVE-12-12-49-0-Air temperature"));
    EXPECT_EQ(sensor->unit(), QStringLiteral("°C"));

    const CanonicalState state = sensor->computeState(0);
    ASSERT_TRUE(state.isNumeric());
    EXPECT_DOUBLE_EQ(state.value.toDouble(), 21.3);

    const QJsonObject attrs = sensor->attributes();
    EXPECT_EQ(attrs.value(QStringLiteral("node_id")).toInt(), 12);
    EXPECT_EQ(attrs.value(QStringLiteral("battery_level")).toInt(), 87);
    EXPECT_EQ(attrs.value(QStringLiteral("location")).toString(), QStringLiteral("Kitchen"));
}

TEST(ZWaveClassificationTest, AttributesOmitUnknownFields)
{
    const ZWaveNode node = makeNode(0x0086, 0x0064);
    const std::optional<ZWaveSensor> sensor =
        ZWaveSensor::create(node, makeValue(CommandClass::SensorBinary, QStringLiteral("Any")));
    ASSERT_TRUE(sensor.has_value());
    const QJsonObject attrs = sensor->attributes();
    EXPECT_TRUE(attrs.contains(QStringLiteral("node_id")));
    EXPECT_FALSE(attrs.contains(QStringLiteral("battery_level")));
    EXPECT_FALSE(attrs.contains(QStringLiteral("location")));
}
