#pragma once

#include <QString>

namespace phicore::zwemo {

// Blocking TCP reachability check of an MQTT broker, for "Test connection"
// in the adapter setup. Does not speak MQTT.
bool probeBroker(const QString &host, quint16 port, int timeoutMs, QString &errorString);

} // namespace phicore::zwemo
