#pragma once

#include "adapterfactory.h"

namespace phicore::zwemo::wemo {

class WemoAdapterFactory : public AdapterFactory
{
    Q_OBJECT
    Q_PLUGIN_METADATA(IID PHI_ADAPTER_FACTORY_IID)
    Q_INTERFACES(phicore::AdapterFactory)

public:
    WemoAdapterFactory(QObject *parent = nullptr) : AdapterFactory(parent) {}

    QString pluginType()  const override { return QStringLiteral("wemo"); }
    QString displayName() const override { return QStringLiteral("WeMo"); }
    QString apiVersion()  const override { return QStringLiteral("1.0.0"); }
    QString description() const override { return QStringLiteral("WeMo switches via an MQTT bridge."); }
    QByteArray icon() const override;

    AdapterCapabilities capabilities() const override;
    discovery::DiscoveryList discover() const override;
    AdapterConfigSchema configSchema(const Adapter &info) const override;
    ActionResponse invokeTestConnection(Adapter &infoInOut) const override;
    AdapterInterface *create(QObject *parent = nullptr) override;
};

} // namespace phicore::zwemo::wemo
