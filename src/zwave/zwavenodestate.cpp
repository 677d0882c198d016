#include "zwavenodestate.h"

#include <utility>

#include "corelog.h"

namespace phicore::zwemo::zwave {

ZWaveNodeState ZWaveNodeState::build(const ZWaveNode &node, const ZWaveNodeState *previous)
{
    ZWaveNodeState state;
    state.m_node = node;

    for (const ZWaveValue &value : node.values) {
        std::optional<ZWaveSensor> sensor = ZWaveSensor::create(node, value);
        if (!sensor || state.m_sensors.contains(value.valueId))
            continue;
        if (previous) {
            const auto prevIt = previous->m_sensors.constFind(value.valueId);
            if (prevIt != previous->m_sensors.constEnd() && prevIt.value().variant() == sensor->variant()) {
                sensor = prevIt.value();
                sensor->setBatteryLevel(node.batteryLevel);
                sensor->setLocation(node.location);
                const auto lastIt = previous->m_lastPushed.constFind(value.valueId);
                if (lastIt != previous->m_lastPushed.constEnd())
                    state.m_lastPushed.insert(value.valueId, lastIt.value());
            }
        }
        state.m_valueIds.append(value.valueId);
        state.m_sensors.insert(value.valueId, *sensor);
    }
    return state;
}

const ZWaveSensor *ZWaveNodeState::sensor(const QString &valueId) const
{
    const auto it = m_sensors.constFind(valueId);
    return it != m_sensors.constEnd() ? &it.value() : nullptr;
}

bool ZWaveNodeState::applyBatteryLevel(const QVariant &level)
{
    bool ok = false;
    const int battery = level.toInt(&ok);
    if (!ok) {
        qCWarning(zwemoCoreLog) << "Ignoring battery level" << level << "for node" << m_node.nodeId;
        return false;
    }
    if (m_node.batteryLevel && *m_node.batteryLevel == battery)
        return false;
    m_node.batteryLevel = battery;
    for (auto it = m_sensors.begin(); it != m_sensors.end(); ++it)
        it.value().setBatteryLevel(battery);
    return true;
}

SensorUpdate ZWaveNodeState::handleNotification(const QString &valueId, const Notification &notification)
{
    const auto it = m_sensors.find(valueId);
    if (it == m_sensors.end())
        return SensorUpdate();
    const SensorUpdate update = it.value().handleNotification(notification, lastPushed(valueId));
    if (update.push)
        m_lastPushed.insert(valueId, *update.push);
    return update;
}

std::optional<CanonicalState> ZWaveNodeState::lastPushed(const QString &valueId) const
{
    const auto it = m_lastPushed.constFind(valueId);
    if (it == m_lastPushed.constEnd())
        return std::nullopt;
    return it.value();
}

void ZWaveNodeState::recordPushed(const QString &valueId, const CanonicalState &state)
{
    m_lastPushed.insert(valueId, state);
}

QList<QPair<QString, CanonicalState>> ZWaveNodeState::takeInitialStates(qint64 nowMs)
{
    QList<QPair<QString, CanonicalState>> states;
    for (const QString &valueId : std::as_const(m_valueIds)) {
        const ZWaveSensor &sensor = m_sensors[valueId];
        if (!sensor.hasValue() && sensor.variant() != SensorVariant::TriggerWorkaround)
            continue;
        const CanonicalState state = sensor.computeState(nowMs);
        m_lastPushed.insert(valueId, state);
        states.append(qMakePair(valueId, state));
    }
    return states;
}

QJsonObject ZWaveNodeState::attributes() const
{
    if (!m_valueIds.isEmpty())
        return m_sensors.value(m_valueIds.first()).attributes();
    QJsonObject attrs;
    attrs.insert(QStringLiteral("node_id"), m_node.nodeId);
    return attrs;
}

void ValueBacklog::setListedNodes(const QSet<int> &nodeIds)
{
    m_listedNodes = nodeIds;
    for (auto it = m_values.begin(); it != m_values.end();) {
        if (m_listedNodes.contains(it.value().topic.nodeId))
            it = m_values.erase(it);
        else
            ++it;
    }
}

bool ValueBacklog::hold(const PendingValue &value)
{
    if (m_listedNodes.contains(value.topic.nodeId))
        return false;
    m_values.insert(value.topic.valueId, value);
    return true;
}

QList<PendingValue> ValueBacklog::take(const QStringList &valueIds)
{
    QList<PendingValue> taken;
    for (const QString &valueId : valueIds) {
        const auto it = m_values.find(valueId);
        if (it == m_values.end())
            continue;
        taken.append(it.value());
        m_values.erase(it);
    }
    return taken;
}

void ValueBacklog::clear()
{
    m_listedNodes.clear();
    m_values.clear();
}

} // namespace phicore::zwemo::zwave
