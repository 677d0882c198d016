#include <gtest/gtest.h>

#include "zwave_fixtures.h"
#include "zwavevalue.h"

using namespace phicore::zwemo::zwave;
using zwemo_test::kGetNodesResponse;

TEST(ZWaveValueTest, MakeValueId)
{
    EXPECT_EQ(makeValueId(7, 49, 0, QStringLiteral("Air temperature")), QStringLiteral("7-49-0-Air temperature"));
    EXPECT_EQ(makeValueId(7, 113, 1, QStringLiteral("Home Security"), QStringLiteral("Cover status")),
              QStringLiteral("7-113-1-Home Security-Cover status"));
}

TEST(ZWaveValueTest, ParsesGetNodesResponse)
{
    QList<ZWaveNode> nodes;
    QString error;
    ASSERT_TRUE(parseNodeList(kGetNodesResponse, nodes, error)) << error.toStdString();
    ASSERT_EQ(nodes.size(), 1);

    const ZWaveNode &node = nodes.first();
    EXPECT_EQ(node.nodeId, 7);
    EXPECT_EQ(node.manufacturerId, 0x013c);
    EXPECT_EQ(node.productId, 0x0002);
    EXPECT_EQ(node.location, QStringLiteral("Hallway"));
    EXPECT_EQ(node.displayName(), QStringLiteral("Philio Technology Corp PST02-A"));
    ASSERT_TRUE(node.batteryLevel.has_value());
    EXPECT_EQ(*node.batteryLevel, 90);
    EXPECT_EQ(node.configValue(kReArmConfigParameter).toInt(), 3);
    EXPECT_EQ(node.values.size(), 5);
}

TEST(ZWaveValueTest, ParsesValuesAsObjectMap)
{
    const QByteArray payload = QByteArrayLiteral(R"({"success": true, "result": [
        { "id": 3, "name": "Porch", "values": {
            "3-48-0-Any": { "commandClass": 48, "endpoint": 0, "property": "Any", "value": true } } }
    ]})");
    QList<ZWaveNode> nodes;
    QString error;
    ASSERT_TRUE(parseNodeList(payload, nodes, error));
    ASSERT_EQ(nodes.size(), 1);
    EXPECT_EQ(nodes.first().displayName(), QStringLiteral("Porch"));
    ASSERT_EQ(nodes.first().values.size(), 1);
    EXPECT_EQ(nodes.first().values.first().valueId, QStringLiteral("3-48-0-Any"));
    EXPECT_EQ(nodes.first().values.first().value, QVariant(true));
}

TEST(ZWaveValueTest, RejectsFailedOrMalformedResponses)
{
    QList<ZWaveNode> nodes;
    QString error;
    EXPECT_FALSE(parseNodeList(QByteArrayLiteral(R"({"success": false, "message": "Gateway busy"})"), nodes, error));
    EXPECT_EQ(error, QStringLiteral("Gateway busy"));
    EXPECT_FALSE(parseNodeList(QByteArrayLiteral("{not json"), nodes, error));
    EXPECT_FALSE(error.isEmpty());
}

TEST(ZWaveValueTest, TopicAndNodeListAgreeOnValueIdentity)
{
    QList<ZWaveNode> nodes;
    QString error;
    ASSERT_TRUE(parseNodeList(kGetNodesResponse, nodes, error));

    const std::optional<ValueTopic> temperature =
        parseValueTopic(QStringLiteral("zwave"), QStringLiteral("zwave/nodeID_7/49/0/Air temperature"));
    ASSERT_TRUE(temperature.has_value());
    EXPECT_EQ(temperature->nodeId, 7);
    EXPECT_EQ(temperature->commandClass, 49);
    EXPECT_EQ(temperature->valueId, nodes.first().values.at(1).valueId);

    const std::optional<ValueTopic> alarm = parseValueTopic(
        QStringLiteral("zwave/"), QStringLiteral("zwave/7/113/0/Home Security/Motion sensor status"));
    ASSERT_TRUE(alarm.has_value());
    EXPECT_EQ(alarm->propertyKey, QStringLiteral("Motion sensor status"));
    EXPECT_EQ(alarm->valueId, nodes.first().values.at(4).valueId);
}

TEST(ZWaveValueTest, IgnoresNonValueTopics)
{
    const QString prefix = QStringLiteral("zwave");
    EXPECT_FALSE(parseValueTopic(prefix, QStringLiteral("zwave/nodeID_7/status")));
    EXPECT_FALSE(parseValueTopic(prefix, QStringLiteral("zwave/nodeID_7/lastActive")));
    EXPECT_FALSE(parseValueTopic(prefix, QStringLiteral("zwave/_CLIENTS/ZWAVE_GATEWAY-zwave-js-ui/status")));
    EXPECT_FALSE(parseValueTopic(prefix, QStringLiteral("zwave/nodeID_7/37/0/targetValue/set")));
    EXPECT_FALSE(parseValueTopic(prefix, QStringLiteral("other/nodeID_7/49/0/Air temperature")));
}

TEST(ZWaveValueTest, ParsesTimeValuePayload)
{
    qint64 timeMs = 0;
    bool ok = false;
    const QVariant value = parseValuePayload(QByteArrayLiteral(R"({"time": 1700000000123, "value": 22.5})"),
                                             &timeMs, &ok);
    EXPECT_TRUE(ok);
    EXPECT_EQ(timeMs, 1700000000123);
    EXPECT_DOUBLE_EQ(value.toDouble(), 22.5);
}

TEST(ZWaveValueTest, ParsesBareValuePayloads)
{
    bool ok = false;
    EXPECT_EQ(parseValuePayload(QByteArrayLiteral("true"), nullptr, &ok), QVariant(true));
    EXPECT_TRUE(ok);

    const QVariant integer = parseValuePayload(QByteArrayLiteral("5"), nullptr, &ok);
    EXPECT_TRUE(ok);
    EXPECT_EQ(integer.typeId(), QMetaType::LongLong);
    EXPECT_EQ(integer.toLongLong(), 5);

    EXPECT_EQ(parseValuePayload(QByteArrayLiteral("\"idle\""), nullptr, &ok), QVariant(QStringLiteral("idle")));
    EXPECT_TRUE(ok);
}

TEST(ZWaveValueTest, RejectsMalformedPayload)
{
    bool ok = true;
    EXPECT_FALSE(parseValuePayload(QByteArrayLiteral("{\"value\": "), nullptr, &ok).isValid());
    EXPECT_FALSE(ok);
    ok = true;
    parseValuePayload(QByteArray(), nullptr, &ok);
    EXPECT_FALSE(ok);
}
