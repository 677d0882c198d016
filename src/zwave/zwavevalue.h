#pragma once

#include <optional>

#include <QByteArray>
#include <QHash>
#include <QJsonObject>
#include <QList>
#include <QString>
#include <QVariant>

namespace phicore::zwemo::zwave {

// Z-Wave command classes this adapter cares about.
namespace CommandClass {
constexpr int SensorBinary     = 0x30;
constexpr int SensorMultilevel = 0x31;
constexpr int Meter            = 0x32;
constexpr int Configuration    = 0x70;
constexpr int Alarm            = 0x71;   // Notification in Z-Wave Plus
constexpr int Battery          = 0x80;
}

constexpr int kReArmConfigParameter = 9;

// Binary, multilevel, meter and notification values; the only classes that
// can become sensors.
bool isSensorCommandClass(int commandClass);

// One value descriptor of a node as reported by the gateway.
struct ZWaveValue {
    QString  valueId;       // node-cc-endpoint-property[-propertyKey]
    int      nodeId = 0;
    int      commandClass = 0;
    int      endpoint = 0;
    QString  property;
    QString  propertyKey;
    QString  type;
    QString  unit;
    QString  label;
    QVariant value;

    bool isDecimal() const;
};

struct ZWaveNode {
    int     nodeId = 0;
    int     manufacturerId = 0;
    int     productId = 0;
    QString name;
    QString location;
    QString manufacturer;
    QString product;
    std::optional<int> batteryLevel;
    QHash<int, QVariant> configuration;     // parameter number -> value
    QList<ZWaveValue> values;

    // Node name, or "<manufacturer> <product>" when the node is unnamed.
    QString displayName() const;
    QVariant configValue(int parameter) const { return configuration.value(parameter); }
};

// Identity of a value as carried by an MQTT value topic.
struct ValueTopic {
    QString valueId;
    int     nodeId = 0;
    int     commandClass = 0;
    int     endpoint = 0;
    QString property;
    QString propertyKey;
};

QString makeValueId(int nodeId, int commandClass, int endpoint,
                    const QString &property, const QString &propertyKey = QString());

std::optional<ZWaveNode> parseNode(const QJsonObject &obj);

// Parses a getNodes API response. Returns false and sets error on malformed
// or unsuccessful responses; nodes without an id are skipped.
bool parseNodeList(const QByteArray &payload, QList<ZWaveNode> &nodes, QString &error);

// <prefix>/<nodeID_n|n>/<cc>/<endpoint>/<property>[/<propertyKey>]
std::optional<ValueTopic> parseValueTopic(const QString &prefix, const QString &topic);

// Accepts {"time": ms, "value": v} or a bare JSON value. Integral numbers
// come back as qint64, others as double.
QVariant parseValuePayload(const QByteArray &payload, qint64 *timeMs = nullptr, bool *ok = nullptr);

} // namespace phicore::zwemo::zwave
