#include "statenormalizer.h"

#include <cmath>

namespace {

const QString kCelsius = QStringLiteral("°C");
const QString kFahrenheit = QStringLiteral("°F");

bool isFloating(const QVariant &value)
{
    const int type = value.typeId();
    return type == QMetaType::Double || type == QMetaType::Float;
}

double roundTo(double value, int decimals)
{
    const double factor = std::pow(10.0, decimals);
    return std::round(value * factor) / factor;
}

}

namespace phicore::zwemo {

bool isTemperatureUnit(const QString &unit)
{
    const QString u = unit.trimmed();
    return u == QStringLiteral("C") || u == QStringLiteral("F")
        || u == kCelsius || u == kFahrenheit;
}

QString canonicalUnit(const QString &unit)
{
    const QString u = unit.trimmed();
    if (u == QStringLiteral("C") || u == kCelsius)
        return kCelsius;
    if (u == QStringLiteral("F") || u == kFahrenheit)
        return kFahrenheit;
    return unit;
}

bool isTruthy(const QVariant &raw)
{
    if (!raw.isValid() || raw.isNull())
        return false;
    switch (raw.typeId()) {
    case QMetaType::Bool:
        return raw.toBool();
    case QMetaType::Int:
    case QMetaType::UInt:
    case QMetaType::Long:
    case QMetaType::ULong:
    case QMetaType::LongLong:
    case QMetaType::ULongLong:
    case QMetaType::Short:
    case QMetaType::UShort:
    case QMetaType::Char:
    case QMetaType::SChar:
    case QMetaType::UChar:
        return raw.toLongLong() != 0;
    case QMetaType::Double:
    case QMetaType::Float:
        return raw.toDouble() != 0.0;
    case QMetaType::QString: {
        const QString text = raw.toString().trimmed().toLower();
        if (text.isEmpty())
            return false;
        return text != QStringLiteral("false")
            && text != QStringLiteral("off")
            && text != QStringLiteral("0");
    }
    default:
        return raw.toBool();
    }
}

CanonicalState normalize(ValueClass valueClass, const QVariant &raw, const QString &unit)
{
    switch (valueClass) {
    case ValueClass::Binary:
        return isTruthy(raw) ? CanonicalState::on() : CanonicalState::off();
    case ValueClass::Multilevel: {
        if (isTemperatureUnit(unit)) {
            if (isFloating(raw))
                return CanonicalState::numeric(roundTo(raw.toDouble(), 1), canonicalUnit(unit));
            return CanonicalState::numeric(raw, canonicalUnit(unit));
        }
        if (isFloating(raw))
            return CanonicalState::numeric(roundTo(raw.toDouble(), 2), unit);
        return CanonicalState::numeric(raw, unit);
    }
    case ValueClass::Alarm:
        // Alarm subtypes are interpreted downstream.
        return CanonicalState::numeric(raw, unit);
    }
    return CanonicalState::off();
}

} // namespace phicore::zwemo
