#pragma once

#include <QObject>
#include <QString>
#include <QTimer>

#include "mqttclient.h"

namespace phicore::zwemo {

struct BrokerSettings {
    static constexpr int kDefaultPort = 1883;
    static constexpr int kDefaultRetryIntervalMs = 10000;
    static constexpr int kMinRetryIntervalMs = 1000;

    QString host;
    int     port = kDefaultPort;
    QString user;
    QString password;
    QString baseTopic;
    int     retryIntervalMs = kDefaultRetryIntervalMs;

    // Trims host, user and base topic, strips trailing '/' from the base
    // topic and falls back to the defaults for anything unusable.
    BrokerSettings normalized(const QString &defaultBaseTopic) const;
};

// The MQTT side of an adapter: one MqttClient, the "<base>/#" subscription
// and a reconnect timer that retries every retryIntervalMs while the
// connection is open but the broker is away.
class BrokerConnection : public QObject
{
    Q_OBJECT

public:
    explicit BrokerConnection(const QString &clientId, QObject *parent = nullptr);
    ~BrokerConnection() override;

    // Takes effect on the next connect; a changed base topic is unsubscribed.
    void configure(const BrokerSettings &settings);
    const BrokerSettings &settings() const { return m_settings; }
    QString baseTopic() const { return m_settings.baseTopic; }
    QString wildcardTopic() const { return m_settings.baseTopic + QStringLiteral("/#"); }

    void open();
    void close();
    void reconnect();
    bool isOpen() const { return m_open; }
    bool isConnected() const { return m_connected; }

    // Subscribing again makes the broker resend its retained messages.
    void resubscribe();
    int publish(const QString &topic, const QByteArray &payload);

signals:
    void connectionStateChanged(bool connected);
    void ready();
    void messageReceived(const QByteArray &message, const QString &topic, bool retained);

private:
    void connectToBroker();
    void setConnected(bool connected);
    void scheduleReconnect();

    MqttClient *m_client = nullptr;
    QTimer *m_reconnectTimer = nullptr;
    BrokerSettings m_settings;
    bool m_open = false;
    bool m_connected = false;
};

} // namespace phicore::zwemo
