#include "zwaveadapter.h"

#include <QDateTime>
#include <QJsonArray>
#include <QJsonDocument>
#include <QLoggingCategory>
#include <QSet>

#include "adapterbroker.h"
#include "statenormalizer.h"

Q_LOGGING_CATEGORY(adapterLog, "phi-core.adapters.zwave")

namespace {

QString deviceIdForNode(int nodeId)
{
    return QStringLiteral("nodeID_%1").arg(nodeId);
}

bool labelContains(const QString &label, const char *word)
{
    return label.contains(QLatin1String(word), Qt::CaseInsensitive);
}

}

namespace phicore::zwemo::zwave {

ZWaveAdapter::ZWaveAdapter(QObject *parent)
    : AdapterInterface(parent)
{
}

ZWaveAdapter::~ZWaveAdapter()
{
    stop();
}

bool ZWaveAdapter::start(QString &errorString)
{
    errorString.clear();
    m_pendingFullSync = false;
    ensureRunningRegistry(m_registry, this);

    if (!m_broker) {
        m_broker = new BrokerConnection(QStringLiteral("phi-core-zwave-%1").arg(adapter().id), this);
        connect(m_broker, &BrokerConnection::connectionStateChanged, this, [this](bool connected) {
            emit connectionStateChanged(connected);
        });
        connect(m_broker, &BrokerConnection::ready, this, [this]() {
            requestNodes();
        });
        connect(m_broker, &BrokerConnection::messageReceived, this,
                [this](const QByteArray &message, const QString &topic, bool retained) {
            handleMqttMessage(message, topic, retained);
        });
    }
    applyConfig();

    const BrokerSettings &settings = m_broker->settings();
    qCInfo(adapterLog) << "Starting Z-Wave adapter for" << adapter().id
                       << "host" << settings.host
                       << "port" << settings.port
                       << "baseTopic" << settings.baseTopic
                       << "gateway" << m_gatewayName
                       << "retryIntervalMs" << settings.retryIntervalMs;

    m_broker->open();
    return true;
}

void ZWaveAdapter::stop()
{
    if (m_broker) {
        m_broker->close();
        m_broker->deleteLater();
        m_broker = nullptr;
    }
    if (m_registry)
        m_registry->stop();
    m_backlog.clear();
}

void ZWaveAdapter::adapterConfigUpdated()
{
    applyConfig();
    if (m_broker)
        m_broker->reconnect();
}

void ZWaveAdapter::requestFullSync()
{
    m_pendingFullSync = true;
    for (auto it = m_nodes.constBegin(); it != m_nodes.constEnd(); ++it)
        emit deviceUpdated(it.value().device, it.value().channels);

    if (m_broker && m_broker->isConnected()) {
        qCInfo(adapterLog) << "Z-Wave full sync requested";
        requestNodes();
        return;
    }
    // Nothing to wait for while the broker is away.
    m_pendingFullSync = false;
    emit fullSyncCompleted();
}

void ZWaveAdapter::updateChannelState(const QString &deviceExternalId,
                                      const QString &channelExternalId,
                                      const QVariant &value,
                                      CmdId cmdId)
{
    Q_UNUSED(value);
    CmdResponse response;
    response.id = cmdId;
    response.tsMs = QDateTime::currentMSecsSinceEpoch();
    response.status = CmdStatus::NotSupported;

    const auto nodeIt = m_nodes.constFind(m_nodeByDeviceId.value(deviceExternalId));
    if (nodeIt == m_nodes.constEnd()) {
        response.error = QStringLiteral("Unknown device");
    } else if (!nodeIt.value().state.sensor(channelExternalId)) {
        response.error = QStringLiteral("Unknown channel");
    } else {
        response.error = QStringLiteral("Channel is read-only");
    }
    emit cmdResult(response);
}

void ZWaveAdapter::applyConfig()
{
    m_gatewayName = adapter().meta.value(QStringLiteral("gatewayName")).toString().trimmed();
    if (m_gatewayName.isEmpty())
        m_gatewayName = QStringLiteral("zwave-js-ui");
    if (m_broker)
        m_broker->configure(brokerSettingsFor(adapter(), QStringLiteral("zwave")));
}

QString ZWaveAdapter::gatewayApiTopic(const QString &api) const
{
    return QStringLiteral("%1/_CLIENTS/ZWAVE_GATEWAY-%2/api/%3").arg(m_broker->baseTopic(), m_gatewayName, api);
}

void ZWaveAdapter::requestNodes()
{
    if (!m_broker || !m_broker->isConnected())
        return;
    QJsonObject payload;
    payload.insert(QStringLiteral("args"), QJsonArray());
    const QString topic = gatewayApiTopic(QStringLiteral("getNodes")) + QStringLiteral("/set");
    if (m_broker->publish(topic, QJsonDocument(payload).toJson(QJsonDocument::Compact)) < 0)
        qCWarning(adapterLog) << "Z-Wave getNodes request failed on" << topic;
}

void ZWaveAdapter::handleMqttMessage(const QByteArray &message, const QString &topic, bool retained)
{
    if (!m_broker || !m_registry || !m_registry->isRunning())
        return;
    if (topic == gatewayApiTopic(QStringLiteral("getNodes"))) {
        handleNodeList(message);
        return;
    }
    const QString prefix = m_broker->baseTopic() + QLatin1Char('/');
    if (!topic.startsWith(prefix) || topic.startsWith(prefix + QStringLiteral("_CLIENTS/")))
        return;

    // Node status, lastActive and similar topics do not parse as values.
    const std::optional<ValueTopic> valueTopic = parseValueTopic(m_broker->baseTopic(), topic);
    if (!valueTopic)
        return;
    handleValueMessage(*valueTopic, message, retained);
}

void ZWaveAdapter::handleNodeList(const QByteArray &message)
{
    QList<ZWaveNode> nodes;
    QString error;
    if (!parseNodeList(message, nodes, error)) {
        qCWarning(adapterLog) << "Z-Wave: failed to parse getNodes response:" << error;
        return;
    }
    qCInfo(adapterLog) << "Z-Wave node list received, count:" << nodes.size();

    const qint64 nowMs = m_registry->now();
    QSet<int> listed;
    QSet<int> seen;
    for (const ZWaveNode &node : nodes) {
        listed.insert(node.nodeId);
        const auto previousIt = m_nodes.constFind(node.nodeId);
        NodeEntry entry = buildNodeEntry(node, previousIt != m_nodes.constEnd() ? &previousIt.value() : nullptr);
        if (entry.state.isEmpty()) {
            qCDebug(adapterLog) << "Z-Wave node" << node.nodeId << "has no supported sensor values";
            continue;
        }
        seen.insert(node.nodeId);

        const int nodeId = node.nodeId;
        for (const QString &valueId : entry.state.valueIds()) {
            if (m_registry->isSubscribed(valueId))
                continue;
            m_registry->subscribe(valueId, [this, nodeId, valueId](const Notification &notification) {
                handleSensorNotification(nodeId, valueId, notification);
            });
        }

        m_nodeByDeviceId.insert(entry.device.id, nodeId);
        NodeEntry &stored = m_nodes.insert(nodeId, entry).value();
        emit deviceUpdated(stored.device, stored.channels);

        const auto initialStates = stored.state.takeInitialStates(nowMs);
        for (const auto &initial : initialStates)
            pushState(stored, initial.first, initial.second, nowMs);

        const QList<PendingValue> pending = m_backlog.take(stored.state.valueIds());
        for (const PendingValue &value : pending)
            handleValueMessage(value.topic, value.payload, value.retained);
    }
    m_backlog.setListedNodes(listed);

    auto it = m_nodes.begin();
    while (it != m_nodes.end()) {
        if (!seen.contains(it.key())) {
            qCInfo(adapterLog) << "Z-Wave node" << it.key() << "removed";
            emit deviceRemoved(it.value().device.id);
            m_nodeByDeviceId.remove(it.value().device.id);
            it = m_nodes.erase(it);
            continue;
        }
        ++it;
    }

    if (m_pendingFullSync) {
        qCInfo(adapterLog) << "Z-Wave full sync completed via getNodes";
        m_pendingFullSync = false;
        emit fullSyncCompleted();
    }
}

void ZWaveAdapter::handleValueMessage(const ValueTopic &valueTopic, const QByteArray &message, bool retained)
{
    qint64 sourceTsMs = 0;
    bool ok = false;
    const QVariant value = parseValuePayload(message, &sourceTsMs, &ok);
    if (!ok) {
        qCWarning(adapterLog).noquote() << "Z-Wave: malformed value payload for" << valueTopic.valueId
                                        << ":" << QString::fromUtf8(message).trimmed();
        return;
    }

    if (valueTopic.commandClass == CommandClass::Battery && valueTopic.property == QStringLiteral("level")) {
        handleBatteryLevel(valueTopic.nodeId, value);
        return;
    }

    if (!m_nodes.contains(valueTopic.nodeId)) {
        PendingValue pending;
        pending.topic = valueTopic;
        pending.payload = message;
        pending.retained = retained;
        if (!m_backlog.hold(pending))
            qCDebug(adapterLog) << "Z-Wave: dropping value" << valueTopic.valueId << "of a node without sensors";
        return;
    }

    Notification notification;
    notification.kind = Notification::Kind::ValueChanged;
    notification.key = valueTopic.valueId;
    notification.deviceId = deviceIdForNode(valueTopic.nodeId);
    notification.payload = value;
    notification.tsMs = m_registry->now();
    notification.sourceTsMs = sourceTsMs;
    notification.retained = retained;
    m_registry->dispatch(notification);
}

void ZWaveAdapter::handleBatteryLevel(int nodeId, const QVariant &level)
{
    const auto nodeIt = m_nodes.find(nodeId);
    if (nodeIt == m_nodes.end())
        return;
    NodeEntry &entry = nodeIt.value();
    if (!entry.state.applyBatteryLevel(level))
        return;
    entry.device.flags |= DeviceFlag::DeviceFlagBattery;
    entry.device.meta.insert(QStringLiteral("attributes"), entry.state.attributes());
    emit deviceUpdated(entry.device, entry.channels);
}

void ZWaveAdapter::handleSensorNotification(int nodeId, const QString &valueId, const Notification &notification)
{
    const auto nodeIt = m_nodes.find(nodeId);
    if (nodeIt == m_nodes.end())
        return;
    NodeEntry &entry = nodeIt.value();
    const SensorUpdate update = entry.state.handleNotification(valueId, notification);
    if (update.reEvaluateAtMs)
        m_registry->scheduleReEvaluation(valueId, *update.reEvaluateAtMs);
    if (update.push)
        pushState(entry, valueId, *update.push, notification.tsMs);
}

ZWaveAdapter::NodeEntry ZWaveAdapter::buildNodeEntry(const ZWaveNode &node, const NodeEntry *previous) const
{
    NodeEntry entry;
    entry.state = ZWaveNodeState::build(node, previous ? &previous->state : nullptr);

    entry.device.id = deviceIdForNode(node.nodeId);
    entry.device.name = node.displayName();
    entry.device.deviceClass = DeviceClass::Sensor;
    entry.device.flags = DeviceFlag::DeviceFlagWireless;
    if (node.batteryLevel)
        entry.device.flags |= DeviceFlag::DeviceFlagBattery;
    entry.device.manufacturer = node.manufacturer;
    entry.device.model = node.product;
    entry.device.meta.insert(QStringLiteral("nodeId"), node.nodeId);
    entry.device.meta.insert(QStringLiteral("manufacturerId"), node.manufacturerId);
    entry.device.meta.insert(QStringLiteral("productId"), node.productId);
    entry.device.meta.insert(QStringLiteral("attributes"), entry.state.attributes());

    for (const ZWaveValue &value : node.values) {
        const ZWaveSensor *sensor = entry.state.sensor(value.valueId);
        if (sensor)
            entry.channels.append(buildChannel(*sensor, value));
    }
    return entry;
}

Channel ZWaveAdapter::buildChannel(const ZWaveSensor &sensor, const ZWaveValue &value) const
{
    Channel channel;
    channel.id = sensor.valueId();
    channel.name = sensor.label();
    channel.unit = sensor.unit();
    channel.flags = ChannelFlag::ChannelFlagReadable
        | ChannelFlag::ChannelFlagReportable
        | ChannelFlag::ChannelFlagRetained;

    switch (sensor.variant()) {
    case SensorVariant::TriggerWorkaround:
        channel.kind = ChannelKind::Motion;
        channel.dataType = ChannelDataType::Bool;
        break;
    case SensorVariant::BinarySensor:
        if (labelContains(value.label, "door") || labelContains(value.label, "window")
            || labelContains(value.label, "contact"))
            channel.kind = ChannelKind::Contact;
        else if (labelContains(value.label, "tamper"))
            channel.kind = ChannelKind::Tamper;
        else
            channel.kind = ChannelKind::Motion;
        channel.dataType = ChannelDataType::Bool;
        break;
    case SensorVariant::MultilevelSensor: {
        const QString unit = sensor.unit();
        channel.dataType = ChannelDataType::Float;
        if (isTemperatureUnit(unit)) {
            channel.kind = ChannelKind::Temperature;
        } else if (unit.compare(QStringLiteral("lux"), Qt::CaseInsensitive) == 0) {
            channel.kind = ChannelKind::Illuminance;
            channel.dataType = ChannelDataType::Int;
        } else if (unit == QStringLiteral("%") && labelContains(value.label, "humid")) {
            channel.kind = ChannelKind::Humidity;
        } else if (unit == QStringLiteral("W")) {
            channel.kind = ChannelKind::Power;
        } else if (unit == QStringLiteral("kWh")) {
            channel.kind = ChannelKind::Energy;
        } else if (unit == QStringLiteral("V")) {
            channel.kind = ChannelKind::Voltage;
        } else if (unit == QStringLiteral("A")) {
            channel.kind = ChannelKind::Current;
        } else {
            channel.kind = ChannelKind::Unknown;
        }
        break;
    }
    case SensorVariant::AlarmSensor:
        channel.kind = ChannelKind::Unknown;
        channel.dataType = ChannelDataType::Int;
        break;
    }

    channel.meta.insert(QStringLiteral("uniqueId"), sensor.uniqueId());
    channel.meta.insert(QStringLiteral("commandClass"), value.commandClass);
    channel.meta.insert(QStringLiteral("endpoint"), value.endpoint);
    channel.meta.insert(QStringLiteral("property"), value.property);
    if (sensor.variant() == SensorVariant::TriggerWorkaround)
        channel.meta.insert(QStringLiteral("reArmSeconds"), sensor.triggerWindow().reArmSeconds());
    return channel;
}

void ZWaveAdapter::pushState(const NodeEntry &entry, const QString &valueId, const CanonicalState &state, qint64 tsMs)
{
    emit channelStateUpdated(entry.device.id, valueId, state.toVariant(), tsMs);
}

} // namespace phicore::zwemo::zwave
