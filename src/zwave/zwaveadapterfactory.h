#pragma once

#include "adapterfactory.h"

namespace phicore::zwemo::zwave {

class ZWaveAdapterFactory : public AdapterFactory
{
    Q_OBJECT
    Q_PLUGIN_METADATA(IID PHI_ADAPTER_FACTORY_IID)
    Q_INTERFACES(phicore::AdapterFactory)

public:
    ZWaveAdapterFactory(QObject *parent = nullptr) : AdapterFactory(parent) {}

    QString pluginType()  const override { return QStringLiteral("zwave"); }
    QString displayName() const override { return QStringLiteral("Z-Wave"); }
    QString apiVersion()  const override { return QStringLiteral("1.0.0"); }
    QString description() const override { return QStringLiteral("Z-Wave sensors via a zwave-js-ui MQTT gateway."); }
    QByteArray icon() const override;

    AdapterCapabilities capabilities() const override;
    discovery::DiscoveryList discover() const override;
    AdapterConfigSchema configSchema(const Adapter &info) const override;
    ActionResponse invokeTestConnection(Adapter &infoInOut) const override;
    AdapterInterface *create(QObject *parent = nullptr) override;
};

} // namespace phicore::zwemo::zwave
