#include "zwavevalue.h"

#include <cmath>

#include <QJsonArray>
#include <QJsonDocument>
#include <QJsonParseError>
#include <QStringList>

namespace {

// Node ids, command classes and endpoints arrive as numbers, or as numeric
// strings in topics.
int toInt(const QJsonValue &value, int fallback = 0)
{
    if (value.isDouble())
        return value.toInt(fallback);
    if (value.isString()) {
        bool ok = false;
        const int parsed = value.toString().trimmed().toInt(&ok, 0);
        return ok ? parsed : fallback;
    }
    return fallback;
}

QString keyToString(const QJsonValue &value)
{
    if (value.isString())
        return value.toString();
    if (value.isDouble())
        return QString::number(value.toVariant().toLongLong());
    return QString();
}

QVariant jsonToVariant(const QJsonValue &value)
{
    if (value.isDouble()) {
        const double d = value.toDouble();
        if (std::isfinite(d) && std::floor(d) == d && std::fabs(d) < 9007199254740992.0)
            return QVariant::fromValue<qint64>(static_cast<qint64>(d));
        return d;
    }
    return value.toVariant();
}

QList<QJsonObject> valueObjects(const QJsonValue &values)
{
    QList<QJsonObject> out;
    if (values.isArray()) {
        const QJsonArray array = values.toArray();
        for (const QJsonValue &entry : array) {
            if (entry.isObject())
                out.append(entry.toObject());
        }
    } else if (values.isObject()) {
        const QJsonObject obj = values.toObject();
        for (auto it = obj.constBegin(); it != obj.constEnd(); ++it) {
            if (it.value().isObject())
                out.append(it.value().toObject());
        }
    }
    return out;
}

int parseNodeSegment(const QString &segment)
{
    QString digits = segment;
    if (digits.startsWith(QStringLiteral("nodeID_"), Qt::CaseInsensitive))
        digits = digits.mid(7);
    bool ok = false;
    const int nodeId = digits.toInt(&ok);
    return ok && nodeId > 0 ? nodeId : 0;
}

}

namespace phicore::zwemo::zwave {

bool isSensorCommandClass(int commandClass)
{
    switch (commandClass) {
    case CommandClass::SensorBinary:
    case CommandClass::SensorMultilevel:
    case CommandClass::Meter:
    case CommandClass::Alarm:
        return true;
    default:
        return false;
    }
}

bool ZWaveValue::isDecimal() const
{
    const QString t = type.trimmed().toLower();
    return t == QStringLiteral("number")
        || t == QStringLiteral("decimal")
        || t == QStringLiteral("float");
}

QString ZWaveNode::displayName() const
{
    if (!name.trimmed().isEmpty())
        return name.trimmed();
    const QString fallback = QStringLiteral("%1 %2").arg(manufacturer.trimmed(), product.trimmed()).trimmed();
    if (!fallback.isEmpty())
        return fallback;
    return QStringLiteral("Node %1").arg(nodeId);
}

QString makeValueId(int nodeId, int commandClass, int endpoint,
                    const QString &property, const QString &propertyKey)
{
    QString id = QStringLiteral("%1-%2-%3-%4").arg(nodeId).arg(commandClass).arg(endpoint).arg(property);
    if (!propertyKey.isEmpty())
        id += QLatin1Char('-') + propertyKey;
    return id;
}

std::optional<ZWaveNode> parseNode(const QJsonObject &obj)
{
    ZWaveNode node;
    node.nodeId = toInt(obj.value(QStringLiteral("id")));
    if (node.nodeId <= 0)
        node.nodeId = toInt(obj.value(QStringLiteral("nodeId")));
    if (node.nodeId <= 0)
        return std::nullopt;

    node.manufacturerId = toInt(obj.value(QStringLiteral("manufacturerId")));
    node.productId = toInt(obj.value(QStringLiteral("productId")));
    node.name = obj.value(QStringLiteral("name")).toString().trimmed();
    node.location = obj.value(QStringLiteral("loc")).toString().trimmed();
    node.manufacturer = obj.value(QStringLiteral("manufacturer")).toString().trimmed();
    node.product = obj.value(QStringLiteral("productLabel")).toString().trimmed();
    if (node.product.isEmpty())
        node.product = obj.value(QStringLiteral("productDescription")).toString().trimmed();

    const QList<QJsonObject> values = valueObjects(obj.value(QStringLiteral("values")));
    for (const QJsonObject &v : values) {
        ZWaveValue value;
        value.nodeId = node.nodeId;
        value.commandClass = toInt(v.value(QStringLiteral("commandClass")));
        value.endpoint = toInt(v.value(QStringLiteral("endpoint")));
        value.property = keyToString(v.value(QStringLiteral("property")));
        value.propertyKey = keyToString(v.value(QStringLiteral("propertyKey")));
        value.type = v.value(QStringLiteral("type")).toString();
        value.unit = v.value(QStringLiteral("unit")).toString();
        value.label = v.value(QStringLiteral("label")).toString().trimmed();
        if (value.label.isEmpty())
            value.label = value.property;
        value.value = jsonToVariant(v.value(QStringLiteral("value")));
        if (value.commandClass <= 0 || value.property.isEmpty())
            continue;
        value.valueId = makeValueId(value.nodeId, value.commandClass, value.endpoint,
                                    value.property, value.propertyKey);

        if (value.commandClass == CommandClass::Battery && value.property == QStringLiteral("level")) {
            if (value.value.isValid() && !value.value.isNull())
                node.batteryLevel = value.value.toInt();
        } else if (value.commandClass == CommandClass::Configuration) {
            bool ok = false;
            const int parameter = value.property.toInt(&ok);
            if (ok)
                node.configuration.insert(parameter, value.value);
        }
        node.values.append(value);
    }
    return node;
}

bool parseNodeList(const QByteArray &payload, QList<ZWaveNode> &nodes, QString &error)
{
    nodes.clear();
    QJsonParseError err;
    const QJsonDocument doc = QJsonDocument::fromJson(payload, &err);
    if (err.error != QJsonParseError::NoError) {
        error = err.errorString();
        return false;
    }

    QJsonArray list;
    if (doc.isArray()) {
        list = doc.array();
    } else if (doc.isObject()) {
        const QJsonObject obj = doc.object();
        if (obj.contains(QStringLiteral("success")) && !obj.value(QStringLiteral("success")).toBool()) {
            error = obj.value(QStringLiteral("message")).toString(QStringLiteral("getNodes failed"));
            return false;
        }
        list = obj.value(QStringLiteral("result")).toArray();
    } else {
        error = QStringLiteral("Unexpected getNodes payload");
        return false;
    }

    for (const QJsonValue &entry : list) {
        if (!entry.isObject())
            continue;
        const std::optional<ZWaveNode> node = parseNode(entry.toObject());
        if (node)
            nodes.append(*node);
    }
    error.clear();
    return true;
}

std::optional<ValueTopic> parseValueTopic(const QString &prefix, const QString &topic)
{
    const QString head = prefix.endsWith(QLatin1Char('/')) ? prefix : prefix + QLatin1Char('/');
    if (!topic.startsWith(head))
        return std::nullopt;
    const QStringList parts = topic.mid(head.size()).split(QLatin1Char('/'));
    if (parts.size() < 4 || parts.size() > 5)
        return std::nullopt;

    ValueTopic result;
    result.nodeId = parseNodeSegment(parts.at(0));
    if (result.nodeId <= 0)
        return std::nullopt;
    bool ok = false;
    result.commandClass = parts.at(1).toInt(&ok);
    if (!ok || result.commandClass <= 0)
        return std::nullopt;
    result.endpoint = parts.at(2).toInt(&ok);
    if (!ok || result.endpoint < 0)
        return std::nullopt;
    result.property = parts.at(3);
    if (result.property.isEmpty() || parts.last() == QStringLiteral("set"))
        return std::nullopt;
    if (parts.size() == 5)
        result.propertyKey = parts.at(4);
    result.valueId = makeValueId(result.nodeId, result.commandClass, result.endpoint,
                                 result.property, result.propertyKey);
    return result;
}

QVariant parseValuePayload(const QByteArray &payload, qint64 *timeMs, bool *ok)
{
    if (ok)
        *ok = false;
    if (timeMs)
        *timeMs = 0;

    const QByteArray trimmed = payload.trimmed();
    if (trimmed.isEmpty())
        return QVariant();

    // QJsonDocument only accepts arrays and objects at top level.
    QJsonParseError err;
    const QJsonDocument doc = QJsonDocument::fromJson(QByteArrayLiteral("[") + trimmed + QByteArrayLiteral("]"), &err);
    if (err.error != QJsonParseError::NoError || !doc.isArray() || doc.array().size() != 1)
        return QVariant();

    const QJsonValue root = doc.array().at(0);
    if (ok)
        *ok = true;
    if (root.isObject()) {
        const QJsonObject obj = root.toObject();
        if (obj.contains(QStringLiteral("value"))) {
            if (timeMs)
                *timeMs = static_cast<qint64>(obj.value(QStringLiteral("time")).toDouble());
            return jsonToVariant(obj.value(QStringLiteral("value")));
        }
    }
    return jsonToVariant(root);
}

} // namespace phicore::zwemo::zwave
