#include "wemoadapter.h"

#include <QDateTime>
#include <QJsonDocument>
#include <QLoggingCategory>
#include <QSet>

#include "adapterbroker.h"

Q_LOGGING_CATEGORY(adapterLog, "phi-core.adapters.wemo")

namespace {

const QString kStateChannel = QStringLiteral("state");
const QString kStandbyChannel = QStringLiteral("standby");

}

namespace phicore::zwemo::wemo {

WemoAdapter::WemoAdapter(QObject *parent)
    : AdapterInterface(parent)
{
}

WemoAdapter::~WemoAdapter()
{
    stop();
}

bool WemoAdapter::start(QString &errorString)
{
    errorString.clear();
    m_pendingFullSync = false;
    ensureRunningRegistry(m_registry, this);

    if (!m_broker) {
        m_broker = new BrokerConnection(QStringLiteral("phi-core-wemo-%1").arg(adapter().id), this);
        connect(m_broker, &BrokerConnection::connectionStateChanged, this, [this](bool connected) {
            emit connectionStateChanged(connected);
        });
        connect(m_broker, &BrokerConnection::messageReceived, this,
                [this](const QByteArray &message, const QString &topic) {
            handleMqttMessage(message, topic);
        });
    }
    applyConfig();

    const BrokerSettings &settings = m_broker->settings();
    qCInfo(adapterLog) << "Starting WeMo adapter for" << adapter().id
                       << "host" << settings.host
                       << "port" << settings.port
                       << "baseTopic" << settings.baseTopic
                       << "retryIntervalMs" << settings.retryIntervalMs;

    m_broker->open();
    return true;
}

void WemoAdapter::stop()
{
    if (m_broker) {
        m_broker->close();
        m_broker->deleteLater();
        m_broker = nullptr;
    }
    if (m_registry)
        m_registry->stop();
    m_pendingStatePayloads.clear();
}

void WemoAdapter::adapterConfigUpdated()
{
    applyConfig();
    if (m_broker)
        m_broker->reconnect();
}

void WemoAdapter::requestFullSync()
{
    m_pendingFullSync = true;
    for (auto it = m_switches.constBegin(); it != m_switches.constEnd(); ++it)
        emit deviceUpdated(it.value().device, it.value().channels);

    if (m_broker && m_broker->isConnected()) {
        qCInfo(adapterLog) << "WeMo full sync requested";
        m_broker->resubscribe();
        return;
    }
    m_pendingFullSync = false;
    emit fullSyncCompleted();
}

void WemoAdapter::updateChannelState(const QString &deviceExternalId,
                                     const QString &channelExternalId,
                                     const QVariant &value,
                                     CmdId cmdId)
{
    CmdResponse response;
    response.id = cmdId;
    response.tsMs = QDateTime::currentMSecsSinceEpoch();

    const auto switchIt = m_switches.constFind(deviceExternalId);
    if (switchIt == m_switches.constEnd()) {
        response.status = CmdStatus::NotSupported;
        response.error = QStringLiteral("Unknown device");
        emit cmdResult(response);
        return;
    }
    if (channelExternalId == kStandbyChannel && switchIt.value().wemo.isInsight()) {
        response.status = CmdStatus::NotSupported;
        response.error = QStringLiteral("Channel is read-only");
        emit cmdResult(response);
        return;
    }
    if (channelExternalId != kStateChannel) {
        response.status = CmdStatus::NotSupported;
        response.error = QStringLiteral("Unknown channel");
        emit cmdResult(response);
        return;
    }
    if (!value.canConvert<bool>()) {
        response.status = CmdStatus::InvalidArgument;
        response.error = QStringLiteral("Expected a boolean value");
        emit cmdResult(response);
        return;
    }

    if (!m_broker || !m_broker->isConnected()) {
        response.status = CmdStatus::TemporarilyOffline;
        response.error = QStringLiteral("MQTT broker not connected");
        emit cmdResult(response);
        return;
    }

    const bool on = value.toBool();
    QJsonObject payload;
    payload.insert(QStringLiteral("state"), on ? QStringLiteral("ON") : QStringLiteral("OFF"));
    const QString topic = QStringLiteral("%1/%2/set").arg(m_broker->baseTopic(), deviceExternalId);
    const int msgId = m_broker->publish(topic, QJsonDocument(payload).toJson(QJsonDocument::Compact));
    if (msgId < 0) {
        response.status = CmdStatus::Failure;
        response.error = QStringLiteral("MQTT publish failed.");
        emit cmdResult(response);
        return;
    }
    qCInfo(adapterLog) << "WeMo" << switchIt.value().device.name << (on ? "turn on" : "turn off");

    response.status = CmdStatus::Success;
    emit cmdResult(response);
}

void WemoAdapter::applyConfig()
{
    if (m_broker)
        m_broker->configure(brokerSettingsFor(adapter(), QStringLiteral("wemo")));
}

void WemoAdapter::handleMqttMessage(const QByteArray &message, const QString &topic)
{
    if (!m_broker || !m_registry || !m_registry->isRunning())
        return;
    const QString prefix = m_broker->baseTopic() + QLatin1Char('/');
    if (!topic.startsWith(prefix))
        return;
    const QString suffix = topic.mid(prefix.size());

    if (suffix == QStringLiteral("bridge/devices")) {
        handleDeviceList(message);
        return;
    }
    if (suffix.startsWith(QStringLiteral("bridge/")))
        return;

    const QStringList parts = suffix.split(QLatin1Char('/'));
    if (parts.size() != 2 || parts.at(1) != QStringLiteral("state"))
        return;
    handleStatePayload(parts.at(0), message);
}

void WemoAdapter::handleDeviceList(const QByteArray &message)
{
    QList<WemoDeviceInfo> devices;
    QString error;
    if (!parseDeviceList(message, devices, error)) {
        qCWarning(adapterLog) << "WeMo: failed to parse bridge/devices payload:" << error;
        return;
    }
    qCInfo(adapterLog) << "WeMo bridge/devices payload count:" << devices.size();

    QSet<QString> seen;
    for (const WemoDeviceInfo &info : devices) {
        if (!isSwitchModel(info.modelName)) {
            qCDebug(adapterLog) << "WeMo: skipping" << info.name << "model" << info.modelName;
            continue;
        }
        seen.insert(info.serialNumber);

        const auto previousIt = m_switches.constFind(info.serialNumber);
        SwitchEntry entry = buildSwitchEntry(info, previousIt != m_switches.constEnd() ? &previousIt.value() : nullptr);

        const QString serial = info.serialNumber;
        if (!m_registry->isSubscribed(serial)) {
            m_registry->subscribe(serial, [this, serial](const Notification &notification) {
                handleSwitchNotification(serial, notification);
            });
        }
        m_switches.insert(serial, entry);
        emit deviceUpdated(entry.device, entry.channels);

        const auto pendingIt = m_pendingStatePayloads.find(serial);
        if (pendingIt != m_pendingStatePayloads.end()) {
            const QByteArray pending = pendingIt.value();
            m_pendingStatePayloads.erase(pendingIt);
            handleStatePayload(serial, pending);
        }
    }

    auto it = m_switches.begin();
    while (it != m_switches.end()) {
        if (!seen.contains(it.key())) {
            emit deviceRemoved(it.value().device.id);
            it = m_switches.erase(it);
            continue;
        }
        ++it;
    }

    if (m_pendingFullSync) {
        qCInfo(adapterLog) << "WeMo full sync completed via bridge/devices payload";
        m_pendingFullSync = false;
        emit fullSyncCompleted();
    }
}

void WemoAdapter::handleStatePayload(const QString &serial, const QByteArray &message)
{
    if (!m_switches.contains(serial)) {
        m_pendingStatePayloads.insert(serial, message);
        return;
    }
    Notification notification;
    notification.kind = Notification::Kind::StateChanged;
    notification.key = serial;
    notification.deviceId = serial;
    notification.payload = message;
    notification.tsMs = m_registry->now();
    m_registry->dispatch(notification);
}

void WemoAdapter::handleSwitchNotification(const QString &serial, const Notification &notification)
{
    const auto switchIt = m_switches.find(serial);
    if (switchIt == m_switches.end())
        return;
    SwitchEntry &entry = switchIt.value();
    qCInfo(adapterLog) << "Subscription update for" << entry.device.name;

    QString error;
    if (!entry.wemo.refresh(notification.payload.toByteArray(), error)) {
        qCWarning(adapterLog) << "Could not update status for" << entry.device.name << ":" << error;
        return;
    }

    const CanonicalState state = entry.wemo.computeState();
    emit channelStateUpdated(entry.device.id, kStateChannel, state.isOn(), notification.tsMs);
    if (entry.wemo.isInsight()) {
        emit channelStateUpdated(entry.device.id, kStandbyChannel,
                                 state.kind == CanonicalState::Kind::Standby, notification.tsMs);
    }

    const QJsonObject attributes = entry.wemo.attributes();
    if (entry.device.meta.value(QStringLiteral("attributes")).toObject() != attributes) {
        entry.device.meta.insert(QStringLiteral("attributes"), attributes);
        emit deviceUpdated(entry.device, entry.channels);
    }
}

WemoAdapter::SwitchEntry WemoAdapter::buildSwitchEntry(const WemoDeviceInfo &info, const SwitchEntry *previous) const
{
    SwitchEntry entry;
    entry.wemo = WemoSwitch::carryOver(previous ? &previous->wemo : nullptr, info);

    entry.device.id = info.serialNumber;
    entry.device.name = info.name;
    entry.device.manufacturer = QStringLiteral("Belkin");
    entry.device.model = info.modelName;
    if (info.modelName.compare(QStringLiteral("Socket"), Qt::CaseInsensitive) == 0
        || info.modelName.compare(QStringLiteral("Insight"), Qt::CaseInsensitive) == 0)
        entry.device.deviceClass = DeviceClass::Plug;
    else
        entry.device.deviceClass = DeviceClass::Switch;
    entry.device.flags = DeviceFlag::DeviceFlagWireless;
    entry.device.meta.insert(QStringLiteral("serialnumber"), info.serialNumber);
    if (!info.host.isEmpty())
        entry.device.meta.insert(QStringLiteral("host"), info.host);
    if (!info.mac.isEmpty())
        entry.device.meta.insert(QStringLiteral("mac"), info.mac);
    entry.device.meta.insert(QStringLiteral("attributes"), entry.wemo.attributes());

    Channel power;
    power.id = kStateChannel;
    power.name = QStringLiteral("Power");
    power.kind = ChannelKind::PowerOnOff;
    power.dataType = ChannelDataType::Bool;
    power.flags = ChannelFlag::ChannelFlagReadable
        | ChannelFlag::ChannelFlagWritable
        | ChannelFlag::ChannelFlagReportable
        | ChannelFlag::ChannelFlagRetained;
    power.meta.insert(QStringLiteral("uniqueId"), info.serialNumber);
    entry.channels.append(power);

    if (entry.wemo.isInsight()) {
        Channel standby;
        standby.id = kStandbyChannel;
        standby.name = QStringLiteral("Standby");
        standby.kind = ChannelKind::Unknown;
        standby.dataType = ChannelDataType::Bool;
        standby.flags = ChannelFlag::ChannelFlagReadable
            | ChannelFlag::ChannelFlagReportable
            | ChannelFlag::ChannelFlagRetained;
        entry.channels.append(standby);
    }
    return entry;
}

} // namespace phicore::zwemo::wemo
