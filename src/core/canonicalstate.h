#pragma once

#include <QString>
#include <QVariant>

namespace phicore::zwemo {

// Normalized device state as exposed to phi-core, independent of the
// vendor payload it was derived from.
struct CanonicalState {
    enum class Kind : quint8 {
        Off = 0,
        On,
        Standby,
        Numeric
    };

    Kind     kind = Kind::Off;
    QVariant value;     // Numeric only
    QString  unit;      // Numeric only, host-canonical

    static CanonicalState off() { return CanonicalState(); }
    static CanonicalState on();
    static CanonicalState standby();
    static CanonicalState numeric(const QVariant &value, const QString &unit = QString());

    // Standby counts as powered.
    bool isOn() const { return kind == Kind::On || kind == Kind::Standby; }
    bool isNumeric() const { return kind == Kind::Numeric; }

    // Value pushed on a channel: bool for On/Off/Standby, the value itself for Numeric.
    QVariant toVariant() const;
    QString toString() const;

    bool operator==(const CanonicalState &other) const;
    bool operator!=(const CanonicalState &other) const { return !(*this == other); }
};

} // namespace phicore::zwemo
