#include "zwavesensor.h"

#include "corelog.h"
#include "statenormalizer.h"

namespace {

struct WorkaroundEntry {
    int manufacturerId;
    int productId;
    int commandClass;
    const char *property;
    const char *propertyKey;    // empty matches a value without a key
    phicore::zwemo::zwave::Workaround kind;
};

using phicore::zwemo::zwave::Workaround;

// Sensors that report "triggered" but never send the matching "off".
constexpr WorkaroundEntry kWorkarounds[] = {
    // Philio PST02 slim multi-sensor, motion as binary sensor and as notification
    { 0x013c, 0x0002, 0x30, "Motion", "", Workaround::TriggerNoOffEvent },
    { 0x013c, 0x0002, 0x71, "Home Security", "Motion sensor status", Workaround::TriggerNoOffEvent },
};

phicore::zwemo::ValueClass valueClassFor(phicore::zwemo::zwave::SensorVariant variant)
{
    using phicore::zwemo::ValueClass;
    using phicore::zwemo::zwave::SensorVariant;
    switch (variant) {
    case SensorVariant::TriggerWorkaround:
    case SensorVariant::BinarySensor:
        return ValueClass::Binary;
    case SensorVariant::MultilevelSensor:
        return ValueClass::Multilevel;
    case SensorVariant::AlarmSensor:
        return ValueClass::Alarm;
    }
    return ValueClass::Binary;
}

}

namespace phicore::zwemo::zwave {

Workaround lookupWorkaround(int manufacturerId, int productId, const ZWaveValue &value)
{
    if (!isSensorCommandClass(value.commandClass))
        return Workaround::None;
    for (const WorkaroundEntry &entry : kWorkarounds) {
        if (entry.manufacturerId == manufacturerId
            && entry.productId == productId
            && entry.commandClass == value.commandClass
            && value.property == QLatin1String(entry.property)
            && value.propertyKey == QLatin1String(entry.propertyKey))
            return entry.kind;
    }
    return Workaround::None;
}

std::optional<SensorVariant> classifyValue(const ZWaveNode &node, const ZWaveValue &value)
{
    if (lookupWorkaround(node.manufacturerId, node.productId, value) == Workaround::TriggerNoOffEvent)
        return SensorVariant::TriggerWorkaround;

    switch (value.commandClass) {
    case CommandClass::SensorBinary:
        return SensorVariant::BinarySensor;
    case CommandClass::SensorMultilevel:
        return SensorVariant::MultilevelSensor;
    case CommandClass::Meter:
        if (value.isDecimal())
            return SensorVariant::MultilevelSensor;
        break;
    case CommandClass::Alarm:
        return SensorVariant::AlarmSensor;
    default:
        break;
    }
    qCDebug(zwemoCoreLog) << "Skipping unclassified value" << value.valueId
                          << "cc" << value.commandClass << "type" << value.type;
    return std::nullopt;
}

int reArmSecondsForNode(const ZWaveNode &node)
{
    const QVariant raw = node.configValue(kReArmConfigParameter);
    bool ok = false;
    const int multiplier = raw.isValid() ? raw.toInt(&ok) : 0;
    return TriggerWindow::reArmSecondsForMultiplier(ok ? multiplier : 0);
}

std::optional<ZWaveSensor> ZWaveSensor::create(const ZWaveNode &node, const ZWaveValue &value)
{
    const std::optional<SensorVariant> variant = classifyValue(node, value);
    if (!variant)
        return std::nullopt;

    ZWaveSensor sensor;
    sensor.m_variant = *variant;
    sensor.m_valueId = value.valueId;
    sensor.m_nodeId = node.nodeId;
    sensor.m_label = value.label;
    sensor.m_name = QStringLiteral("%1 %2").arg(node.displayName(), value.label).trimmed();
    sensor.m_unit = canonicalUnit(value.unit);
    sensor.m_batteryLevel = node.batteryLevel;
    sensor.m_location = node.location;
    if (sensor.m_variant == SensorVariant::TriggerWorkaround)
        sensor.m_window = TriggerWindow(reArmSecondsForNode(node));
    else
        sensor.m_raw = value.value;
    return sensor;
}

QString ZWaveSensor::uniqueId() const
{
    return QStringLiteral("ZWAVE-%1-%2").arg(m_nodeId).arg(m_valueId);
}

std::optional<qint64> ZWaveSensor::applyValue(const QVariant &raw, qint64 eventMs)
{
    m_raw = raw;
    if (m_variant != SensorVariant::TriggerWorkaround)
        return std::nullopt;
    if (!isTruthy(raw)) {
        m_window.reset();
        return std::nullopt;
    }
    return m_window.trigger(eventMs);
}

SensorUpdate ZWaveSensor::handleNotification(const Notification &notification,
                                             const std::optional<CanonicalState> &lastPushed)
{
    SensorUpdate update;
    const qint64 nowMs = notification.tsMs;

    if (notification.kind == Notification::Kind::ReEvaluate) {
        const CanonicalState state = computeState(nowMs);
        // Still on: superseded by a later trigger with its own re-evaluation.
        if (state.isOn())
            return update;
        if (lastPushed && *lastPushed == state)
            return update;
        update.push = state;
        return update;
    }

    if (m_variant == SensorVariant::TriggerWorkaround && notification.retained
        && notification.sourceTsMs <= 0 && isTruthy(notification.payload)) {
        m_raw = notification.payload;
        update.push = computeState(nowMs);
        return update;
    }

    const qint64 eventMs = notification.sourceTsMs > 0 ? qMin(notification.sourceTsMs, nowMs) : nowMs;
    const std::optional<qint64> expiresAtMs = applyValue(notification.payload, eventMs);
    if (expiresAtMs && *expiresAtMs > nowMs)
        update.reEvaluateAtMs = *expiresAtMs;
    update.push = computeState(nowMs);
    return update;
}

CanonicalState ZWaveSensor::computeState(qint64 nowMs) const
{
    if (m_variant == SensorVariant::TriggerWorkaround) {
        if (isTruthy(m_raw) && m_window.isTriggered(nowMs))
            return CanonicalState::on();
        return CanonicalState::off();
    }
    return normalize(valueClassFor(m_variant), m_raw, m_unit);
}

QJsonObject ZWaveSensor::attributes() const
{
    QJsonObject attrs;
    attrs.insert(QStringLiteral("node_id"), m_nodeId);
    if (m_batteryLevel)
        attrs.insert(QStringLiteral("battery_level"), *m_batteryLevel);
    if (!m_location.isEmpty())
        attrs.insert(QStringLiteral("location"), m_location);
    return attrs;
}

} // namespace phicore::zwemo::zwave
