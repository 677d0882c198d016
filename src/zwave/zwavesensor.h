#pragma once

#include <optional>

#include <QJsonObject>
#include <QString>
#include <QVariant>

#include "canonicalstate.h"
#include "notification.h"
#include "triggerwindow.h"
#include "zwavevalue.h"

namespace phicore::zwemo::zwave {

enum class SensorVariant : quint8 {
    TriggerWorkaround = 0,
    BinarySensor,
    MultilevelSensor,
    AlarmSensor
};

enum class Workaround : quint8 {
    None = 0,
    TriggerNoOffEvent
};

// Keyed on the device and on the value's command class, property and
// property key. Values of non-sensor command classes never match.
Workaround lookupWorkaround(int manufacturerId, int productId, const ZWaveValue &value);

// Workaround table first, then the command class rules. std::nullopt for
// values that are not sensors this adapter exposes.
std::optional<SensorVariant> classifyValue(const ZWaveNode &node, const ZWaveValue &value);

// Configuration parameter 9 times 8 seconds.
int reArmSecondsForNode(const ZWaveNode &node);

// Outcome of one notification for one sensor.
struct SensorUpdate {
    std::optional<CanonicalState> push;     // state to publish
    std::optional<qint64> reEvaluateAtMs;   // trigger window check still due
};

// One exposed Z-Wave value. Holds the latest raw value and, for trigger
// sensors, the re-arm window; the canonical state is computed on demand.
class ZWaveSensor
{
public:
    ZWaveSensor() = default;

    static std::optional<ZWaveSensor> create(const ZWaveNode &node, const ZWaveValue &value);

    SensorVariant variant() const { return m_variant; }
    QString valueId() const { return m_valueId; }
    int nodeId() const { return m_nodeId; }
    QString uniqueId() const;
    QString name() const { return m_name; }
    QString label() const { return m_label; }
    QString unit() const { return m_unit; }
    QVariant rawValue() const { return m_raw; }
    bool hasValue() const { return m_raw.isValid() && !m_raw.isNull(); }
    const TriggerWindow &triggerWindow() const { return m_window; }

    // Stores a new raw value observed at eventMs. For trigger sensors an "on"
    // value opens or extends the window and the returned time is when the
    // window must be re-evaluated; an "off" value closes it.
    std::optional<qint64> applyValue(const QVariant &raw, qint64 eventMs);

    // Value notifications are applied at their source time when they carry
    // one. A retained value without a source time may be arbitrarily old and
    // opens no trigger window. ReEvaluate pushes only a changed, non-on state.
    SensorUpdate handleNotification(const Notification &notification,
                                    const std::optional<CanonicalState> &lastPushed);

    CanonicalState computeState(qint64 nowMs) const;

    QJsonObject attributes() const;
    void setBatteryLevel(std::optional<int> level) { m_batteryLevel = level; }
    void setLocation(const QString &location) { m_location = location; }

private:
    SensorVariant m_variant = SensorVariant::BinarySensor;
    QString m_valueId;
    int m_nodeId = 0;
    QString m_name;
    QString m_label;
    QString m_unit;
    QVariant m_raw;
    TriggerWindow m_window;
    std::optional<int> m_batteryLevel;
    QString m_location;
};

} // namespace phicore::zwemo::zwave
