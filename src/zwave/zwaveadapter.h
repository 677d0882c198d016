#pragma once

#include <QHash>
#include <QPointer>

#include "adapterinterface.h"

#include "brokerconnection.h"
#include "notification.h"
#include "subscriptionregistry.h"
#include "zwavenodestate.h"

namespace phicore::zwemo::zwave {

// Z-Wave sensors through a zwave-js-ui MQTT gateway. Each node becomes a
// device, each classified value a read-only channel.
class ZWaveAdapter : public AdapterInterface
{
    Q_OBJECT

public:
    explicit ZWaveAdapter(QObject *parent = nullptr);
    ~ZWaveAdapter() override;

protected:
    bool start(QString &errorString) override;
    void stop() override;
    void adapterConfigUpdated() override;
    void requestFullSync() override;
    void updateChannelState(const QString &deviceExternalId,
                            const QString &channelExternalId,
                            const QVariant &value,
                            CmdId cmdId) override;

private:
    struct NodeEntry {
        Device device;
        ChannelList channels;
        ZWaveNodeState state;
    };

    void applyConfig();
    void requestNodes();
    QString gatewayApiTopic(const QString &api) const;

    void handleMqttMessage(const QByteArray &message, const QString &topic, bool retained);
    void handleNodeList(const QByteArray &message);
    void handleValueMessage(const ValueTopic &valueTopic, const QByteArray &message, bool retained);
    void handleBatteryLevel(int nodeId, const QVariant &level);
    void handleSensorNotification(int nodeId, const QString &valueId, const Notification &notification);

    NodeEntry buildNodeEntry(const ZWaveNode &node, const NodeEntry *previous) const;
    Channel buildChannel(const ZWaveSensor &sensor, const ZWaveValue &value) const;
    void pushState(const NodeEntry &entry, const QString &valueId, const CanonicalState &state, qint64 tsMs);

    BrokerConnection *m_broker = nullptr;
    QPointer<SubscriptionRegistry> m_registry;
    bool m_pendingFullSync = false;
    QString m_gatewayName = QStringLiteral("zwave-js-ui");
    QHash<int, NodeEntry> m_nodes;
    QHash<QString, int> m_nodeByDeviceId;
    ValueBacklog m_backlog;
};

} // namespace phicore::zwemo::zwave
