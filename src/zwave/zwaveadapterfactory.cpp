#include "zwaveadapterfactory.h"
#include "zwaveadapter.h"

#include "brokerprobe.h"

namespace phicore::zwemo::zwave {

static const QByteArray kZWaveIconSvg = QByteArrayLiteral(
    "<svg width=\"24\" height=\"24\" viewBox=\"0 0 24 24\" fill=\"none\" stroke=\"#1E88E5\" stroke-width=\"2\" stroke-linecap=\"round\" stroke-linejoin=\"round\" xmlns=\"http://www.w3.org/2000/svg\" role=\"img\" aria-label=\"Z-Wave\">\n"
    "  <path d=\"M5 6h10L5 18h10\"/>\n"
    "  <path d=\"M18 9a4 4 0 0 1 0 6\"/>\n"
    "  <path d=\"M20.5 7a7 7 0 0 1 0 10\"/>\n"
    "</svg>\n"
);

QByteArray ZWaveAdapterFactory::icon() const
{
    return kZWaveIconSvg;
}

AdapterCapabilities ZWaveAdapterFactory::capabilities() const
{
    AdapterCapabilities caps;
    caps.required = AdapterRequirement::Host;
    caps.required = caps.required | AdapterRequirement::UsesRetryInterval;
    caps.optional = AdapterRequirement::Port | AdapterRequirement::Username | AdapterRequirement::Password;
    caps.flags |= AdapterFlag::AdapterFlagSupportsProbe;
    AdapterActionDescriptor settings;
    settings.id = QStringLiteral("settings");
    settings.label = QStringLiteral("Settings");
    settings.description = QStringLiteral("Edit the zwave-js-ui MQTT connection settings.");
    settings.hasForm = true;
    caps.instanceActions.push_back(settings);
    caps.defaults.insert(QStringLiteral("host"), QStringLiteral("localhost"));
    caps.defaults.insert(QStringLiteral("port"), 1883);
    caps.defaults.insert(QStringLiteral("retryIntervalMs"), 10000);
    caps.defaults.insert(QStringLiteral("baseTopic"), QStringLiteral("zwave"));
    caps.defaults.insert(QStringLiteral("gatewayName"), QStringLiteral("zwave-js-ui"));
    return caps;
}

discovery::DiscoveryList ZWaveAdapterFactory::discover() const
{
    discovery::Discovery info;
    info.pluginType = pluginType();
    info.discoveredId = QStringLiteral("zwave");
    info.label = QStringLiteral("Z-Wave");
    info.hostname = QStringLiteral("localhost");
    info.ip = QStringLiteral("127.0.0.1");
    info.port = 1883;
    info.kind = discovery::DiscoveryKind::Manual;
    return { info };
}

AdapterConfigSchema ZWaveAdapterFactory::configSchema(const Adapter &info) const
{
    AdapterConfigSchema schema;
    schema.title       = QStringLiteral("Z-Wave");
    schema.description = QStringLiteral("Configure the MQTT broker used by zwave-js-ui.");

    {
        AdapterConfigField f;
        f.key         = QStringLiteral("host");
        f.type        = AdapterConfigFieldType::Hostname;
        f.label       = QStringLiteral("MQTT Host");
        f.description = QStringLiteral("IP address or hostname of the MQTT broker.");
        f.flags       = AdapterConfigFieldFlag::Required;
        f.placeholder = QStringLiteral("localhost");
        if (!info.host.isEmpty())
            f.defaultValue = info.host;
        schema.fields.push_back(f);
    }

    {
        AdapterConfigField f;
        f.key          = QStringLiteral("port");
        f.type         = AdapterConfigFieldType::Port;
        f.label        = QStringLiteral("MQTT Port");
        f.defaultValue = info.port > 0 ? info.port : 1883;
        schema.fields.push_back(f);
    }

    {
        AdapterConfigField f;
        f.key         = QStringLiteral("user");
        f.type        = AdapterConfigFieldType::String;
        f.label       = QStringLiteral("MQTT Username");
        f.description = QStringLiteral("Username for MQTT authentication (optional).");
        if (!info.user.isEmpty())
            f.defaultValue = info.user;
        schema.fields.push_back(f);
    }

    {
        AdapterConfigField f;
        f.key   = QStringLiteral("password");
        f.type  = AdapterConfigFieldType::Password;
        f.label = QStringLiteral("MQTT Password");
        f.flags = AdapterConfigFieldFlag::Secret;
        schema.fields.push_back(f);
    }

    {
        AdapterConfigField f;
        f.key          = QStringLiteral("baseTopic");
        f.type         = AdapterConfigFieldType::String;
        f.label        = QStringLiteral("Prefix");
        f.description  = QStringLiteral("zwave-js-ui MQTT prefix (default: zwave).");
        f.defaultValue = info.meta.value(QStringLiteral("baseTopic")).toString(QStringLiteral("zwave"));
        schema.fields.push_back(f);
    }

    {
        AdapterConfigField f;
        f.key          = QStringLiteral("gatewayName");
        f.type         = AdapterConfigFieldType::String;
        f.label        = QStringLiteral("Gateway name");
        f.description  = QStringLiteral("MQTT name of the zwave-js-ui gateway (default: zwave-js-ui).");
        f.defaultValue = info.meta.value(QStringLiteral("gatewayName")).toString(QStringLiteral("zwave-js-ui"));
        schema.fields.push_back(f);
    }

    {
        AdapterConfigField f;
        f.key          = QStringLiteral("retryIntervalMs");
        f.type         = AdapterConfigFieldType::Integer;
        f.label        = QStringLiteral("Retry interval");
        f.description  = QStringLiteral("Reconnect interval while the broker is offline.");
        f.defaultValue = 10000;
        schema.fields.push_back(f);
    }

    return schema;
}

ActionResponse ZWaveAdapterFactory::invokeTestConnection(Adapter &infoInOut) const
{
    ActionResponse resp;
    QString error;
    if (infoInOut.host.trimmed().isEmpty()) {
        resp.status = CmdStatus::InvalidArgument;
        resp.error = QStringLiteral("Host must not be empty.");
        return resp;
    }
    if (!probeBroker(infoInOut.host, infoInOut.port, 2000, error)) {
        resp.status = CmdStatus::Failure;
        resp.error = error;
        return resp;
    }
    resp.status = CmdStatus::Success;
    return resp;
}

AdapterInterface *ZWaveAdapterFactory::create(QObject *parent)
{
    return new ZWaveAdapter(parent);
}

} // namespace phicore::zwemo::zwave
