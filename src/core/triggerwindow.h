#pragma once

#include <QtGlobal>

namespace phicore::zwemo {

// Synthetic on-window for sensors that report "triggered" but never report
// the matching "off". Armed (off) until trigger(); triggered while
// now < expiresAtMs().
class TriggerWindow
{
public:
    static constexpr int kReArmSecondsPerStep = 8;
    static constexpr int kDefaultReArmMultiplier = 4;

    explicit TriggerWindow(int reArmSeconds = kDefaultReArmMultiplier * kReArmSecondsPerStep);

    // Multipliers <= 0 fall back to kDefaultReArmMultiplier.
    static int reArmSecondsForMultiplier(int multiplier);

    int reArmSeconds() const { return m_reArmSeconds; }
    qint64 expiresAtMs() const { return m_expiresAtMs; }

    bool isTriggered(qint64 nowMs) const { return nowMs < m_expiresAtMs; }

    // Extends the window to now + reArmSeconds, never shortening it.
    // Returns the new expiry, which is the time a re-evaluation is due.
    qint64 trigger(qint64 nowMs);

    // Explicit off from the device.
    void reset() { m_expiresAtMs = 0; }

private:
    int m_reArmSeconds = 0;
    qint64 m_expiresAtMs = 0;
};

} // namespace phicore::zwemo
