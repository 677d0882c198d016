#pragma once

#include <optional>

#include <QByteArray>
#include <QJsonObject>
#include <QList>
#include <QString>

#include "canonicalstate.h"

namespace phicore::zwemo::wemo {

struct WemoDeviceInfo {
    QString serialNumber;
    QString name;
    QString modelName;
    QString host;
    QString mac;
};

// Socket, Insight, Maker and Lightswitch. Bulbs, motion sensors and the
// like are not switches.
bool isSwitchModel(const QString &modelName);

std::optional<WemoDeviceInfo> parseDeviceInfo(const QJsonObject &obj);
bool parseDeviceList(const QByteArray &payload, QList<WemoDeviceInfo> &devices, QString &error);

struct InsightParams {
    QString state;          // "0" off, "1" on, "8" standby
    qint64  currentPower = 0;
    qint64  todayMw = 0;
};

struct MakerParams {
    int  sensorState = 0;   // 1 means "not triggered"
    int  switchMode = 0;    // 0 toggle, 1 momentary
    bool hasSensor = false;
};

class WemoSwitch
{
public:
    WemoSwitch() = default;
    explicit WemoSwitch(const WemoDeviceInfo &info);

    // The switch for a new device list entry. A previous switch of the same
    // model keeps its state and telemetry snapshot and takes over info.
    static WemoSwitch carryOver(const WemoSwitch *previous, const WemoDeviceInfo &info);

    const WemoDeviceInfo &info() const { return m_info; }
    QString serialNumber() const { return m_info.serialNumber; }
    QString name() const { return m_info.name; }
    bool isInsight() const;
    bool isMaker() const;

    // Applies a state payload. The switch state itself must parse; a missing
    // or malformed telemetry block only logs a warning and keeps the last
    // good snapshot.
    bool refresh(const QByteArray &payload, QString &error);

    bool hasState() const { return m_hasState; }
    bool isOn() const { return m_on; }
    bool isStandby() const;
    CanonicalState computeState() const;

    const std::optional<InsightParams> &insightParams() const { return m_insight; }
    const std::optional<MakerParams> &makerParams() const { return m_maker; }

    // current_power_mwh, today_power_mw, sensor_state, switch_mode, has_sensor;
    // only those with a snapshot behind them.
    QJsonObject attributes() const;

private:
    bool refreshInsight(const QJsonObject &payload);
    bool refreshMaker(const QJsonObject &payload);

    WemoDeviceInfo m_info;
    bool m_hasState = false;
    bool m_on = false;
    std::optional<InsightParams> m_insight;
    std::optional<MakerParams> m_maker;
};

} // namespace phicore::zwemo::wemo
