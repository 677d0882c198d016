#include "canonicalstate.h"

namespace phicore::zwemo {

CanonicalState CanonicalState::on()
{
    CanonicalState state;
    state.kind = Kind::On;
    return state;
}

CanonicalState CanonicalState::standby()
{
    CanonicalState state;
    state.kind = Kind::Standby;
    return state;
}

CanonicalState CanonicalState::numeric(const QVariant &value, const QString &unit)
{
    CanonicalState state;
    state.kind = Kind::Numeric;
    state.value = value;
    state.unit = unit;
    return state;
}

QVariant CanonicalState::toVariant() const
{
    switch (kind) {
    case Kind::Off:
        return false;
    case Kind::On:
    case Kind::Standby:
        return true;
    case Kind::Numeric:
        return value;
    }
    return QVariant();
}

QString CanonicalState::toString() const
{
    switch (kind) {
    case Kind::Off:
        return QStringLiteral("off");
    case Kind::On:
        return QStringLiteral("on");
    case Kind::Standby:
        return QStringLiteral("standby");
    case Kind::Numeric:
        return value.toString();
    }
    return QString();
}

bool CanonicalState::operator==(const CanonicalState &other) const
{
    if (kind != other.kind)
        return false;
    if (kind != Kind::Numeric)
        return true;
    return value == other.value && unit == other.unit;
}

} // namespace phicore::zwemo
