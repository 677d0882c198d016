#pragma once

#include <QString>
#include <QVariant>

#include "canonicalstate.h"

namespace phicore::zwemo {

// Capability class of a raw device value, as far as normalization cares.
enum class ValueClass : quint8 {
    Binary = 0,
    Multilevel,     // multilevel sensors and decimal meters
    Alarm
};

QString canonicalUnit(const QString &unit);
bool isTemperatureUnit(const QString &unit);

// Truthiness of a raw vendor value: true, non-zero numbers and non-empty
// strings other than "false"/"off"/"0".
bool isTruthy(const QVariant &raw);

CanonicalState normalize(ValueClass valueClass, const QVariant &raw, const QString &unit);

} // namespace phicore::zwemo
