#include "brokerprobe.h"

#include <QTcpSocket>

namespace phicore::zwemo {

bool probeBroker(const QString &host, quint16 port, int timeoutMs, QString &errorString)
{
    if (host.trimmed().isEmpty()) {
        errorString = QStringLiteral("Host must not be empty.");
        return false;
    }

    QTcpSocket socket;
    socket.connectToHost(host.trimmed(), port > 0 ? port : 1883);
    if (!socket.waitForConnected(timeoutMs)) {
        errorString = socket.errorString();
        socket.abort();
        return false;
    }
    socket.disconnectFromHost();
    errorString.clear();
    return true;
}

} // namespace phicore::zwemo
