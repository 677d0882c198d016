#include "mqttclient.h"

#include <atomic>

#include <QMetaObject>
#include <QMutex>
#include <QMutexLocker>

#include <mosquitto.h>

#include "corelog.h"

namespace phicore::zwemo {

namespace {

// mosquitto_lib_init()/cleanup() are process wide; both adapters may hold clients.
class MosquittoLibrary
{
public:
    MosquittoLibrary()
    {
        QMutexLocker locker(&s_mutex);
        if (s_users++ == 0)
            mosquitto_lib_init();
    }

    ~MosquittoLibrary()
    {
        QMutexLocker locker(&s_mutex);
        if (--s_users == 0)
            mosquitto_lib_cleanup();
    }

    MosquittoLibrary(const MosquittoLibrary &) = delete;
    MosquittoLibrary &operator=(const MosquittoLibrary &) = delete;

private:
    static QMutex s_mutex;
    static int s_users;
};

QMutex MosquittoLibrary::s_mutex;
int MosquittoLibrary::s_users = 0;

struct ConnectionConfig {
    QString clientId;
    QString hostname;
    int port = 1883;
    QString username;
    QString password;
    int keepAliveSeconds = 60;
};

} // namespace

class MqttWorker : public QObject
{
    Q_OBJECT

public:
    explicit MqttWorker(QObject *parent = nullptr)
        : QObject(parent)
    {
    }

    ~MqttWorker() override
    {
        cleanup();
    }

    Q_INVOKABLE void configure(const QString &clientId,
                               const QString &hostname,
                               int port,
                               const QString &username,
                               const QString &password,
                               int keepAliveSeconds)
    {
        m_config.clientId = clientId;
        m_config.hostname = hostname;
        m_config.port = port;
        m_config.username = username;
        m_config.password = password;
        m_config.keepAliveSeconds = keepAliveSeconds;
    }

    Q_INVOKABLE void connectToHost()
    {
        if (m_config.hostname.trimmed().isEmpty()) {
            emit errorOccurred(MOSQ_ERR_INVAL, QStringLiteral("MQTT hostname is empty"));
            return;
        }
        if (m_state == MqttClient::State::Connecting || m_state == MqttClient::State::Connected)
            return;

        if (!m_mosq && !createHandle())
            return;

        const QByteArray userBytes = m_config.username.toUtf8();
        const QByteArray passBytes = m_config.password.toUtf8();
        int rc = mosquitto_username_pw_set(m_mosq,
                                           userBytes.isEmpty() ? nullptr : userBytes.constData(),
                                           passBytes.isEmpty() ? nullptr : passBytes.constData());
        if (rc != MOSQ_ERR_SUCCESS) {
            emit errorOccurred(rc, QStringLiteral("Failed to set MQTT credentials"));
            return;
        }

        rc = mosquitto_connect_async(m_mosq,
                                     m_config.hostname.toUtf8().constData(),
                                     m_config.port,
                                     m_config.keepAliveSeconds);
        if (rc != MOSQ_ERR_SUCCESS) {
            emit errorOccurred(rc, QStringLiteral("MQTT connect failed: %1")
                                       .arg(QString::fromUtf8(mosquitto_strerror(rc))));
            return;
        }

        setState(MqttClient::State::Connecting);
        startLoop();
    }

    Q_INVOKABLE void disconnectFromHost()
    {
        if (!m_mosq || m_state == MqttClient::State::Disconnected)
            return;
        const int rc = mosquitto_disconnect(m_mosq);
        if (rc != MOSQ_ERR_SUCCESS)
            emit errorOccurred(rc, QStringLiteral("MQTT disconnect failed"));
    }

    Q_INVOKABLE void subscribe(const QString &topicFilter, int qos)
    {
        {
            QMutexLocker locker(&m_subscriptionMutex);
            m_subscriptions.insert(topicFilter, qos);
        }
        if (m_state == MqttClient::State::Connected)
            sendSubscribe(topicFilter, qos);
    }

    Q_INVOKABLE void unsubscribe(const QString &topicFilter)
    {
        {
            QMutexLocker locker(&m_subscriptionMutex);
            m_subscriptions.remove(topicFilter);
        }
        if (!m_mosq || m_state != MqttClient::State::Connected)
            return;
        const int rc = mosquitto_unsubscribe(m_mosq, nullptr, topicFilter.toUtf8().constData());
        if (rc != MOSQ_ERR_SUCCESS)
            emit errorOccurred(rc, QStringLiteral("MQTT unsubscribe failed for %1").arg(topicFilter));
    }

    Q_INVOKABLE int publish(const QString &topic, const QByteArray &payload, int qos, bool retain)
    {
        if (!m_mosq)
            return -1;
        int mid = 0;
        const int rc = mosquitto_publish(m_mosq,
                                         &mid,
                                         topic.toUtf8().constData(),
                                         payload.size(),
                                         payload.constData(),
                                         qos,
                                         retain);
        if (rc != MOSQ_ERR_SUCCESS) {
            emit errorOccurred(rc, QStringLiteral("MQTT publish to %1 failed").arg(topic));
            return -1;
        }
        return mid;
    }

    Q_INVOKABLE void shutdown()
    {
        cleanup();
    }

signals:
    void connected();
    void disconnected();
    void messageReceived(const QByteArray &message, const QString &topic, bool retained);
    void errorOccurred(int code, const QString &message);
    void stateChanged(phicore::zwemo::MqttClient::State state);

private:
    bool createHandle()
    {
        const QByteArray clientIdBytes = m_config.clientId.toUtf8();
        m_mosq = mosquitto_new(clientIdBytes.isEmpty() ? nullptr : clientIdBytes.constData(), true, this);
        if (!m_mosq) {
            emit errorOccurred(MOSQ_ERR_NOMEM, QStringLiteral("Failed to allocate mosquitto client"));
            return false;
        }
        mosquitto_connect_callback_set(m_mosq, &MqttWorker::onConnect);
        mosquitto_disconnect_callback_set(m_mosq, &MqttWorker::onDisconnect);
        mosquitto_message_callback_set(m_mosq, &MqttWorker::onMessage);
        mosquitto_log_callback_set(m_mosq, &MqttWorker::onLog);
        return true;
    }

    // Runs on the mosquitto loop thread.
    static void onConnect(struct mosquitto *, void *userdata, int rc)
    {
        auto *worker = static_cast<MqttWorker *>(userdata);
        if (!worker)
            return;
        if (rc != 0) {
            worker->setState(MqttClient::State::Disconnected);
            emit worker->errorOccurred(rc, QStringLiteral("MQTT connect refused: %1")
                                               .arg(QString::fromUtf8(mosquitto_connack_string(rc))));
            return;
        }
        worker->setState(MqttClient::State::Connected);
        worker->restoreSubscriptions();
        emit worker->connected();
    }

    static void onDisconnect(struct mosquitto *, void *userdata, int rc)
    {
        auto *worker = static_cast<MqttWorker *>(userdata);
        if (!worker)
            return;
        if (rc != 0)
            qCInfo(zwemoCoreLog) << "MQTT connection lost, rc" << rc;
        worker->setState(MqttClient::State::Disconnected);
        emit worker->disconnected();
    }

    static void onMessage(struct mosquitto *, void *userdata, const struct mosquitto_message *msg)
    {
        auto *worker = static_cast<MqttWorker *>(userdata);
        if (!worker || !msg || !msg->topic)
            return;
        const QByteArray payload(static_cast<const char *>(msg->payload), msg->payloadlen);
        emit worker->messageReceived(payload, QString::fromUtf8(msg->topic), msg->retain);
    }

    static void onLog(struct mosquitto *, void *userdata, int level, const char *str)
    {
        auto *worker = static_cast<MqttWorker *>(userdata);
        if (!worker || !str)
            return;
        if (level & MOSQ_LOG_ERR)
            emit worker->errorOccurred(MOSQ_ERR_UNKNOWN, QString::fromUtf8(str));
        else if (level & MOSQ_LOG_WARNING)
            qCWarning(zwemoCoreLog) << "mosquitto:" << str;
    }

    void restoreSubscriptions()
    {
        QHash<QString, int> subscriptions;
        {
            QMutexLocker locker(&m_subscriptionMutex);
            subscriptions = m_subscriptions;
        }
        for (auto it = subscriptions.constBegin(); it != subscriptions.constEnd(); ++it)
            sendSubscribe(it.key(), it.value());
    }

    void sendSubscribe(const QString &topicFilter, int qos)
    {
        if (!m_mosq)
            return;
        const int rc = mosquitto_subscribe(m_mosq, nullptr, topicFilter.toUtf8().constData(), qos);
        if (rc != MOSQ_ERR_SUCCESS)
            emit errorOccurred(rc, QStringLiteral("MQTT subscribe failed for %1").arg(topicFilter));
    }

    void startLoop()
    {
        if (!m_mosq || m_loopRunning)
            return;
        const int rc = mosquitto_loop_start(m_mosq);
        if (rc != MOSQ_ERR_SUCCESS) {
            emit errorOccurred(rc, QStringLiteral("MQTT loop_start failed"));
            return;
        }
        // The loop thread reconnects on its own after connection loss.
        mosquitto_reconnect_delay_set(m_mosq, 2, 60, true);
        m_loopRunning = true;
    }

    void cleanup()
    {
        if (m_mosq) {
            if (m_state != MqttClient::State::Disconnected)
                mosquitto_disconnect(m_mosq);
            if (m_loopRunning)
                mosquitto_loop_stop(m_mosq, true);
            m_loopRunning = false;
            mosquitto_destroy(m_mosq);
            m_mosq = nullptr;
        }
        m_state = MqttClient::State::Disconnected;
    }

    void setState(MqttClient::State state)
    {
        if (m_state == state)
            return;
        m_state = state;
        emit stateChanged(m_state);
    }

    MosquittoLibrary m_library;
    struct mosquitto *m_mosq = nullptr;
    bool m_loopRunning = false;
    ConnectionConfig m_config;
    QMutex m_subscriptionMutex;
    QHash<QString, int> m_subscriptions;
    std::atomic<MqttClient::State> m_state { MqttClient::State::Disconnected };
};

MqttClient::MqttClient(QObject *parent)
    : QObject(parent)
    , m_worker(new MqttWorker())
    , m_workerThread(new QThread(this))
{
    qRegisterMetaType<phicore::zwemo::MqttClient::State>();

    m_worker->moveToThread(m_workerThread);
    connect(m_workerThread, &QThread::finished, m_worker, &QObject::deleteLater);

    connect(m_worker, &MqttWorker::connected, this, &MqttClient::connected);
    connect(m_worker, &MqttWorker::disconnected, this, &MqttClient::disconnected);
    connect(m_worker, &MqttWorker::messageReceived, this, &MqttClient::messageReceived);
    connect(m_worker, &MqttWorker::errorOccurred, this, &MqttClient::errorOccurred);
    connect(m_worker, &MqttWorker::stateChanged, this, [this](MqttClient::State state) {
        setState(state);
    });

    m_workerThread->setObjectName(QStringLiteral("zwemo-mqtt"));
    m_workerThread->start();
}

MqttClient::~MqttClient()
{
    if (m_workerThread && m_workerThread->isRunning()) {
        QMetaObject::invokeMethod(m_worker, "shutdown", Qt::BlockingQueuedConnection);
        m_workerThread->quit();
        m_workerThread->wait();
    }
}

void MqttClient::setClientId(const QString &clientId)
{
    m_clientId = clientId;
}

void MqttClient::setHostname(const QString &hostname)
{
    m_hostname = hostname.trimmed();
}

void MqttClient::setPort(int port)
{
    m_port = port > 0 ? port : 1883;
}

void MqttClient::setCredentials(const QString &username, const QString &password)
{
    m_username = username;
    m_password = password;
}

void MqttClient::setKeepAlive(int keepAliveSeconds)
{
    m_keepAliveSeconds = keepAliveSeconds > 0 ? keepAliveSeconds : 60;
}

MqttClient::State MqttClient::state() const
{
    return m_state;
}

void MqttClient::connectToHost()
{
    if (!m_worker)
        return;
    QMetaObject::invokeMethod(m_worker, "configure", Qt::QueuedConnection,
                              Q_ARG(QString, m_clientId),
                              Q_ARG(QString, m_hostname),
                              Q_ARG(int, m_port),
                              Q_ARG(QString, m_username),
                              Q_ARG(QString, m_password),
                              Q_ARG(int, m_keepAliveSeconds));
    QMetaObject::invokeMethod(m_worker, "connectToHost", Qt::QueuedConnection);
}

void MqttClient::disconnectFromHost()
{
    if (m_worker)
        QMetaObject::invokeMethod(m_worker, "disconnectFromHost", Qt::QueuedConnection);
}

int MqttClient::publish(const QString &topic, const QByteArray &payload, int qos, bool retain)
{
    if (!m_worker)
        return -1;
    if (QThread::currentThread() == m_workerThread)
        return m_worker->publish(topic, payload, qos, retain);
    int mid = -1;
    QMetaObject::invokeMethod(m_worker,
                              "publish",
                              Qt::BlockingQueuedConnection,
                              Q_RETURN_ARG(int, mid),
                              Q_ARG(QString, topic),
                              Q_ARG(QByteArray, payload),
                              Q_ARG(int, qos),
                              Q_ARG(bool, retain));
    return mid;
}

void MqttClient::subscribe(const QString &topicFilter, int qos)
{
    m_subscriptions.insert(topicFilter, qos);
    if (m_worker)
        QMetaObject::invokeMethod(m_worker, "subscribe", Qt::QueuedConnection,
                                  Q_ARG(QString, topicFilter), Q_ARG(int, qos));
}

void MqttClient::unsubscribe(const QString &topicFilter)
{
    m_subscriptions.remove(topicFilter);
    if (m_worker)
        QMetaObject::invokeMethod(m_worker, "unsubscribe", Qt::QueuedConnection,
                                  Q_ARG(QString, topicFilter));
}

void MqttClient::setState(State state)
{
    if (m_state == state)
        return;
    m_state = state;
    emit stateChanged(m_state);
}

} // namespace phicore::zwemo

#include "mqttclient.moc"
