#pragma once

#include <QString>
#include <QVariant>

namespace phicore::zwemo {

// One message on the notification channel. Produced by the MQTT side of an
// adapter or by a due re-evaluation, consumed by SubscriptionRegistry.
struct Notification {
    enum class Kind : quint8 {
        ValueChanged = 0,   // single raw value (Z-Wave)
        StateChanged,       // full state payload (WeMo)
        ReEvaluate          // deferred re-evaluation of a trigger window
    };

    Kind     kind = Kind::ValueChanged;
    QString  key;               // routing identity: Z-Wave value id, WeMo serial number
    QString  deviceId;          // owning device, informational
    QVariant payload;
    qint64   tsMs = 0;          // dispatch time
    qint64   sourceTsMs = 0;    // device-side time from the payload, 0 when unknown
    bool     retained = false;  // replayed by the broker, possibly stale

    static Notification reEvaluate(const QString &key, qint64 tsMs)
    {
        Notification n;
        n.kind = Kind::ReEvaluate;
        n.key = key;
        n.tsMs = tsMs;
        return n;
    }
};

} // namespace phicore::zwemo
