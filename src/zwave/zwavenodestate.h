#pragma once

#include <optional>

#include <QHash>
#include <QJsonObject>
#include <QList>
#include <QPair>
#include <QSet>
#include <QStringList>

#include "zwavesensor.h"
#include "zwavevalue.h"

namespace phicore::zwemo::zwave {

// The exposed sensors of one node and the last state pushed for each.
class ZWaveNodeState
{
public:
    ZWaveNodeState() = default;

    // One sensor per classified value of node. A sensor that previous already
    // had, with the same variant, keeps its raw value and trigger window.
    static ZWaveNodeState build(const ZWaveNode &node, const ZWaveNodeState *previous = nullptr);

    const ZWaveNode &node() const { return m_node; }
    int nodeId() const { return m_node.nodeId; }
    bool isEmpty() const { return m_valueIds.isEmpty(); }
    const QStringList &valueIds() const { return m_valueIds; }     // node value order
    const ZWaveSensor *sensor(const QString &valueId) const;

    // Applies a battery report to the node and its sensors. False when the
    // level is not a number or did not change.
    bool applyBatteryLevel(const QVariant &level);

    // Routes a notification to the sensor and remembers what it pushed.
    SensorUpdate handleNotification(const QString &valueId, const Notification &notification);

    std::optional<CanonicalState> lastPushed(const QString &valueId) const;
    void recordPushed(const QString &valueId, const CanonicalState &state);

    // What to publish right after a (re)build: every sensor with a value and
    // every trigger sensor. Recorded as pushed.
    QList<QPair<QString, CanonicalState>> takeInitialStates(qint64 nowMs);

    QJsonObject attributes() const;

private:
    ZWaveNode m_node;
    QStringList m_valueIds;
    QHash<QString, ZWaveSensor> m_sensors;          // by value id
    QHash<QString, CanonicalState> m_lastPushed;    // by value id
};

struct PendingValue {
    ValueTopic topic;
    QByteArray payload;
    bool retained = false;
};

// Value messages received before their node is known, latest per value id.
// Nodes the gateway listed without any sensor are never buffered.
class ValueBacklog
{
public:
    // Drops buffered values of nodes in nodeIds that were not taken.
    void setListedNodes(const QSet<int> &nodeIds);
    bool isListed(int nodeId) const { return m_listedNodes.contains(nodeId); }

    // False when the value was dropped instead of buffered.
    bool hold(const PendingValue &value);
    QList<PendingValue> take(const QStringList &valueIds);

    int size() const { return m_values.size(); }
    void clear();

private:
    QSet<int> m_listedNodes;
    QHash<QString, PendingValue> m_values;
};

} // namespace phicore::zwemo::zwave
