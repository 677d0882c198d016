#pragma once

#include <QHash>
#include <QPointer>

#include "adapterinterface.h"

#include "brokerconnection.h"
#include "notification.h"
#include "subscriptionregistry.h"
#include "wemoswitch.h"

namespace phicore::zwemo::wemo {

// WeMo switches through an MQTT bridge. State updates are pushed by the
// bridge; the "state" channel accepts on/off commands.
class WemoAdapter : public AdapterInterface
{
    Q_OBJECT

public:
    explicit WemoAdapter(QObject *parent = nullptr);
    ~WemoAdapter() override;

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
    struct SwitchEntry {
        Device device;
        ChannelList channels;
        WemoSwitch wemo;
    };

    void applyConfig();

    void handleMqttMessage(const QByteArray &message, const QString &topic);
    void handleDeviceList(const QByteArray &message);
    void handleStatePayload(const QString &serial, const QByteArray &message);
    void handleSwitchNotification(const QString &serial, const Notification &notification);

    SwitchEntry buildSwitchEntry(const WemoDeviceInfo &info, const SwitchEntry *previous) const;

    BrokerConnection *m_broker = nullptr;
    QPointer<SubscriptionRegistry> m_registry;
    bool m_pendingFullSync = false;
    QHash<QString, SwitchEntry> m_switches;             // by serial number
    QHash<QString, QByteArray> m_pendingStatePayloads;  // by serial number
};

} // namespace phicore::zwemo::wemo
