#include "wemoswitch.h"

#include <QJsonArray>
#include <QJsonDocument>
#include <QJsonParseError>

#include "corelog.h"

namespace {

const QStringList kSwitchModels = {
    QStringLiteral("Socket"),
    QStringLiteral("Insight"),
    QStringLiteral("Maker"),
    QStringLiteral("Lightswitch"),
};

// Numbers may arrive as JSON numbers or numeric strings.
std::optional<qint64> toInteger(const QJsonValue &value)
{
    if (value.isDouble())
        return static_cast<qint64>(value.toDouble());
    if (value.isBool())
        return value.toBool() ? 1 : 0;
    if (value.isString()) {
        bool ok = false;
        const qint64 parsed = value.toString().trimmed().toLongLong(&ok);
        if (ok)
            return parsed;
    }
    return std::nullopt;
}

std::optional<bool> parseSwitchState(const QJsonValue &value)
{
    if (value.isString()) {
        const QString text = value.toString().trimmed().toUpper();
        if (text == QStringLiteral("ON"))
            return true;
        if (text == QStringLiteral("OFF"))
            return false;
    }
    const std::optional<qint64> numeric = toInteger(value);
    if (!numeric)
        return std::nullopt;
    return *numeric != 0;
}

}

namespace phicore::zwemo::wemo {

bool isSwitchModel(const QString &modelName)
{
    return kSwitchModels.contains(modelName.trimmed(), Qt::CaseInsensitive);
}

std::optional<WemoDeviceInfo> parseDeviceInfo(const QJsonObject &obj)
{
    WemoDeviceInfo info;
    info.serialNumber = obj.value(QStringLiteral("serialnumber")).toString().trimmed();
    if (info.serialNumber.isEmpty())
        return std::nullopt;
    info.name = obj.value(QStringLiteral("name")).toString().trimmed();
    if (info.name.isEmpty())
        info.name = info.serialNumber;
    info.modelName = obj.value(QStringLiteral("model_name")).toString().trimmed();
    info.host = obj.value(QStringLiteral("host")).toString().trimmed();
    info.mac = obj.value(QStringLiteral("mac")).toString().trimmed();
    return info;
}

bool parseDeviceList(const QByteArray &payload, QList<WemoDeviceInfo> &devices, QString &error)
{
    devices.clear();
    QJsonParseError err;
    const QJsonDocument doc = QJsonDocument::fromJson(payload, &err);
    if (err.error != QJsonParseError::NoError) {
        error = err.errorString();
        return false;
    }
    if (!doc.isArray()) {
        error = QStringLiteral("Device list is not an array");
        return false;
    }
    const QJsonArray array = doc.array();
    for (const QJsonValue &entry : array) {
        if (!entry.isObject())
            continue;
        const std::optional<WemoDeviceInfo> info = parseDeviceInfo(entry.toObject());
        if (info)
            devices.append(*info);
    }
    error.clear();
    return true;
}

WemoSwitch::WemoSwitch(const WemoDeviceInfo &info)
    : m_info(info)
{
}

WemoSwitch WemoSwitch::carryOver(const WemoSwitch *previous, const WemoDeviceInfo &info)
{
    if (!previous || previous->m_info.modelName.compare(info.modelName, Qt::CaseInsensitive) != 0)
        return WemoSwitch(info);
    WemoSwitch wemo = *previous;
    wemo.m_info = info;
    return wemo;
}

bool WemoSwitch::isInsight() const
{
    return m_info.modelName.compare(QStringLiteral("Insight"), Qt::CaseInsensitive) == 0;
}

bool WemoSwitch::isMaker() const
{
    return m_info.modelName.compare(QStringLiteral("Maker"), Qt::CaseInsensitive) == 0;
}

bool WemoSwitch::refresh(const QByteArray &payload, QString &error)
{
    QJsonParseError err;
    const QJsonDocument doc = QJsonDocument::fromJson(payload, &err);
    if (err.error != QJsonParseError::NoError || !doc.isObject()) {
        error = err.error != QJsonParseError::NoError
            ? err.errorString()
            : QStringLiteral("State payload is not an object");
        return false;
    }
    const QJsonObject obj = doc.object();
    const std::optional<bool> on = parseSwitchState(obj.value(QStringLiteral("state")));
    if (!on) {
        error = QStringLiteral("State payload has no switch state");
        return false;
    }
    m_on = *on;
    m_hasState = true;
    error.clear();

    if (isInsight() && !refreshInsight(obj))
        qCWarning(zwemoCoreLog) << "Could not update insight status for" << m_info.name;
    else if (isMaker() && !refreshMaker(obj))
        qCWarning(zwemoCoreLog) << "Could not update maker status for" << m_info.name;
    return true;
}

bool WemoSwitch::refreshInsight(const QJsonObject &payload)
{
    const QJsonValue params = payload.value(QStringLiteral("insight_params"));
    if (!params.isObject())
        return false;
    const QJsonObject obj = params.toObject();
    const QJsonValue stateValue = obj.value(QStringLiteral("state"));
    const std::optional<qint64> state = toInteger(stateValue);
    const std::optional<qint64> currentPower = toInteger(obj.value(QStringLiteral("currentpower")));
    const std::optional<qint64> todayMw = toInteger(obj.value(QStringLiteral("todaymw")));
    if (!state || !currentPower || !todayMw)
        return false;

    InsightParams insight;
    insight.state = QString::number(*state);
    insight.currentPower = *currentPower;
    insight.todayMw = *todayMw;
    m_insight = insight;
    return true;
}

bool WemoSwitch::refreshMaker(const QJsonObject &payload)
{
    const QJsonValue params = payload.value(QStringLiteral("maker_params"));
    if (!params.isObject())
        return false;
    const QJsonObject obj = params.toObject();
    const std::optional<qint64> sensorState = toInteger(obj.value(QStringLiteral("sensorstate")));
    const std::optional<qint64> switchMode = toInteger(obj.value(QStringLiteral("switchmode")));
    const std::optional<qint64> hasSensor = toInteger(obj.value(QStringLiteral("hassensor")));
    if (!sensorState || !switchMode || !hasSensor)
        return false;

    MakerParams maker;
    maker.sensorState = static_cast<int>(*sensorState);
    maker.switchMode = static_cast<int>(*switchMode);
    maker.hasSensor = *hasSensor != 0;
    m_maker = maker;
    return true;
}

bool WemoSwitch::isStandby() const
{
    if (!m_insight)
        return false;
    return m_insight->state != QStringLiteral("0") && m_insight->state != QStringLiteral("1");
}

CanonicalState WemoSwitch::computeState() const
{
    if (!m_on)
        return CanonicalState::off();
    if (isStandby())
        return CanonicalState::standby();
    return CanonicalState::on();
}

QJsonObject WemoSwitch::attributes() const
{
    QJsonObject attrs;
    if (m_insight) {
        attrs.insert(QStringLiteral("current_power_mwh"), m_insight->currentPower);
        attrs.insert(QStringLiteral("today_power_mw"), m_insight->todayMw);
    }
    if (m_maker) {
        if (m_maker->hasSensor) {
            // sensorstate 1 is the app's "not triggered"
            attrs.insert(QStringLiteral("sensor_state"),
                         m_maker->sensorState ? QStringLiteral("off") : QStringLiteral("on"));
        }
        attrs.insert(QStringLiteral("switch_mode"), m_maker->switchMode);
        attrs.insert(QStringLiteral("has_sensor"), m_maker->hasSensor);
    }
    return attrs;
}

} // namespace phicore::zwemo::wemo
