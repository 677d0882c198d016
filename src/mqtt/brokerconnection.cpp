#include "brokerconnection.h"

#include "corelog.h"

namespace phicore::zwemo {

BrokerSettings BrokerSettings::normalized(const QString &defaultBaseTopic) const
{
    BrokerSettings result = *this;
    result.host = host.trimmed();
    result.user = user.trimmed();
    if (result.port <= 0 || result.port > 65535)
        result.port = kDefaultPort;
    if (result.retryIntervalMs < kMinRetryIntervalMs)
        result.retryIntervalMs = kDefaultRetryIntervalMs;

    result.baseTopic = baseTopic.trimmed();
    while (result.baseTopic.endsWith(QLatin1Char('/')))
        result.baseTopic.chop(1);
    if (result.baseTopic.isEmpty())
        result.baseTopic = defaultBaseTopic;
    return result;
}

BrokerConnection::BrokerConnection(const QString &clientId, QObject *parent)
    : QObject(parent)
    , m_client(new MqttClient(this))
    , m_reconnectTimer(new QTimer(this))
{
    m_client->setClientId(clientId);
    m_reconnectTimer->setSingleShot(false);

    connect(m_reconnectTimer, &QTimer::timeout, this, [this]() {
        connectToBroker();
    });
    connect(m_client, &MqttClient::connected, this, [this]() {
        qCInfo(zwemoCoreLog) << "MQTT connected to" << m_settings.host << "subscribing to" << wildcardTopic();
        setConnected(true);
        m_client->subscribe(wildcardTopic());
        emit ready();
    });
    connect(m_client, &MqttClient::disconnected, this, [this]() {
        setConnected(false);
        if (m_open)
            scheduleReconnect();
    });
    connect(m_client, &MqttClient::messageReceived, this, &BrokerConnection::messageReceived);
    connect(m_client, &MqttClient::errorOccurred, this, [this](int code, const QString &message) {
        if (m_client->state() == MqttClient::State::Connected)
            return;
        qCWarning(zwemoCoreLog) << "MQTT error:" << code << message;
    });
}

BrokerConnection::~BrokerConnection()
{
    close();
}

void BrokerConnection::configure(const BrokerSettings &settings)
{
    const QString previousWildcard = wildcardTopic();
    const bool hadBaseTopic = !m_settings.baseTopic.isEmpty();
    m_settings = settings;

    if (hadBaseTopic && previousWildcard != wildcardTopic())
        m_client->unsubscribe(previousWildcard);
    m_client->setHostname(m_settings.host);
    m_client->setPort(m_settings.port);
    m_client->setCredentials(m_settings.user, m_settings.password);
    m_reconnectTimer->setInterval(m_settings.retryIntervalMs);
}

void BrokerConnection::open()
{
    m_open = true;
    if (m_settings.host.isEmpty()) {
        qCWarning(zwemoCoreLog) << "MQTT host not configured; staying disconnected";
        return;
    }
    connectToBroker();
}

void BrokerConnection::close()
{
    m_open = false;
    m_reconnectTimer->stop();
    const MqttClient::State state = m_client->state();
    if (state == MqttClient::State::Connected || state == MqttClient::State::Connecting)
        m_client->disconnectFromHost();
    setConnected(false);
}

void BrokerConnection::reconnect()
{
    close();
    open();
}

void BrokerConnection::resubscribe()
{
    if (m_connected)
        m_client->subscribe(wildcardTopic());
}

int BrokerConnection::publish(const QString &topic, const QByteArray &payload)
{
    if (!m_connected)
        return -1;
    return m_client->publish(topic, payload);
}

void BrokerConnection::connectToBroker()
{
    if (!m_open || m_settings.host.isEmpty())
        return;
    const MqttClient::State state = m_client->state();
    if (state == MqttClient::State::Connected || state == MqttClient::State::Connecting)
        return;
    m_client->connectToHost();
}

void BrokerConnection::setConnected(bool connected)
{
    if (m_connected == connected)
        return;
    m_connected = connected;
    if (m_connected)
        m_reconnectTimer->stop();
    emit connectionStateChanged(m_connected);
}

void BrokerConnection::scheduleReconnect()
{
    m_reconnectTimer->setInterval(m_settings.retryIntervalMs);
    if (!m_reconnectTimer->isActive())
        m_reconnectTimer->start();
}

} // namespace phicore::zwemo
