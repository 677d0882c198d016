#include "wemoadapterfactory.h"
#include "wemoadapter.h"

#include "brokerprobe.h"

namespace phicore::zwemo::wemo {

static const QByteArray kWemoIconSvg = QByteArrayLiteral(
    "<svg width=\"24\" height=\"24\" viewBox=\"0 0 24 24\" fill=\"none\" stroke=\"#43A047\" stroke-width=\"2\" stroke-linecap=\"round\" stroke-linejoin=\"round\" xmlns=\"http://www.w3.org/2000/svg\" role=\"img\" aria-label=\"WeMo\">\n"
    "  <rect x=\"6\" y=\"3\" width=\"12\" height=\"18\" rx=\"3\"/>\n"
    "  <path d=\"M12 8v4\"/>\n"
    "  <path d=\"M9.5 10a3.5 3.5 0 1 0 5 0\"/>\n"
    "</svg>\n"
);

QByteArray WemoAdapterFactory::icon() const
{
    return kWemoIconSvg;
}

AdapterCapabilities WemoAdapterFactory::capabilities() const
{
    AdapterCapabilities caps;
    caps.required = AdapterRequirement::Host;
    caps.required = caps.required | AdapterRequirement::UsesRetryInterval;
    caps.optional = AdapterRequirement::Port | AdapterRequirement::Username | AdapterRequirement::Password;
    caps.flags |= AdapterFlag::AdapterFlagSupportsProbe;
    AdapterActionDescriptor settings;
    settings.id = QStringLiteral("settings");
    settings.label = QStringLiteral("Settings");
    settings.description = QStringLiteral("Edit the WeMo bridge MQTT connection settings.");
    settings.hasForm = true;
    caps.instanceActions.push_back(settings);
    caps.defaults.insert(QStringLiteral("host"), QStringLiteral("localhost"));
    caps.defaults.insert(QStringLiteral("port"), 1883);
    caps.defaults.insert(QStringLiteral("retryIntervalMs"), 10000);
    caps.defaults.insert(QStringLiteral("baseTopic"), QStringLiteral("wemo"));
    return caps;
}

discovery::DiscoveryList WemoAdapterFactory::discover() const
{
    discovery::Discovery info;
    info.pluginType = pluginType();
    info.discoveredId = QStringLiteral("wemo");
    info.label = QStringLiteral("WeMo");
    info.hostname = QStringLiteral("localhost");
    info.ip = QStringLiteral("127.0.0.1");
    info.port = 1883;
    info.kind = discovery::DiscoveryKind::Manual;
    return { info };
}

AdapterConfigSchema WemoAdapterFactory::configSchema(const Adapter &info) const
{
    AdapterConfigSchema schema;
    schema.title       = QStringLiteral("WeMo");
    schema.description = QStringLiteral("Configure the MQTT broker the WeMo bridge publishes to.");

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
        f.label        = QStringLiteral("Base topic");
        f.description  = QStringLiteral("WeMo bridge base topic (default: wemo).");
        f.defaultValue = info.meta.value(QStringLiteral("baseTopic")).toString(QStringLiteral("wemo"));
        schema.fields.push_back(f);
    }

    {
        AdapterConfigField f;
        f.key          = QStringLiteral("retryIntervalMs");
        f.type         = AdapterConfigFieldType::Integer;
        f.label        = QStringLiteral("Retry interval");
        f.defaultValue = 10000;
        schema.fields.push_back(f);
    }

    return schema;
}

ActionResponse WemoAdapterFactory::invokeTestConnection(Adapter &infoInOut) const
{
    ActionResponse resp;
    QString error;
    if (!probeBroker(infoInOut.host, infoInOut.port, 2000, error)) {
        resp.status = infoInOut.host.trimmed().isEmpty() ? CmdStatus::InvalidArgument : CmdStatus::Failure;
        resp.error = error;
        return resp;
    }
    resp.status = CmdStatus::Success;
    return resp;
}

AdapterInterface *WemoAdapterFactory::create(QObject *parent)
{
    return new WemoAdapter(parent);
}

} // namespace phicore::zwemo::wemo
