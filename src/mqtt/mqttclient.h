#pragma once

#include <QByteArray>
#include <QHash>
#include <QObject>
#include <QThread>

namespace phicore::zwemo {

class MqttWorker;

// libmosquitto client running its network loop on a worker thread. Topic
// subscriptions are remembered and restored after every reconnect.
class MqttClient : public QObject
{
    Q_OBJECT

public:
    enum class State {
        Disconnected = 0,
        Connecting,
        Connected
    };
    Q_ENUM(State)

    explicit MqttClient(QObject *parent = nullptr);
    ~MqttClient() override;

    void setClientId(const QString &clientId);
    void setHostname(const QString &hostname);
    void setPort(int port);
    void setCredentials(const QString &username, const QString &password);
    void setKeepAlive(int keepAliveSeconds);

    State state() const;
    QString hostname() const { return m_hostname; }
    int port() const { return m_port; }

    void connectToHost();
    void disconnectFromHost();

    int publish(const QString &topic, const QByteArray &payload, int qos = 0, bool retain = false);
    void subscribe(const QString &topicFilter, int qos = 0);
    void unsubscribe(const QString &topicFilter);
    QList<QString> subscriptions() const { return m_subscriptions.keys(); }

signals:
    void connected();
    void disconnected();
    void messageReceived(const QByteArray &message, const QString &topic, bool retained);
    void errorOccurred(int code, const QString &message);
    void stateChanged(phicore::zwemo::MqttClient::State state);

private:
    void setState(State state);

    MqttWorker *m_worker = nullptr;
    QThread *m_workerThread = nullptr;

    QString m_clientId;
    QString m_hostname;
    int m_port = 1883;
    QString m_username;
    QString m_password;
    int m_keepAliveSeconds = 60;
    QHash<QString, int> m_subscriptions;
    State m_state = State::Disconnected;
};

} // namespace phicore::zwemo
