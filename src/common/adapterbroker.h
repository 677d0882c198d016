#pragma once

#include "adapterconfig.h"
#include "brokerconnection.h"

namespace phicore::zwemo {

// Broker settings of an adapter instance. The resolved ip wins over the host
// name; base topic and retry interval come from meta.
inline BrokerSettings brokerSettingsFor(const Adapter &info, const QString &defaultBaseTopic)
{
    BrokerSettings settings;
    settings.host = info.ip.trimmed().isEmpty() ? info.host : info.ip;
    settings.port = info.port > 0 ? info.port : BrokerSettings::kDefaultPort;
    settings.user = info.user;
    settings.password = info.pw;
    settings.baseTopic = info.meta.value(QStringLiteral("baseTopic")).toString();
    settings.retryIntervalMs = info.meta.value(QStringLiteral("retryIntervalMs"))
                                   .toInt(BrokerSettings::kDefaultRetryIntervalMs);
    return settings.normalized(defaultBaseTopic);
}

} // namespace phicore::zwemo
