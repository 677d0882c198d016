#include "triggerwindow.h"

namespace phicore::zwemo {

TriggerWindow::TriggerWindow(int reArmSeconds)
    : m_reArmSeconds(reArmSeconds > 0 ? reArmSeconds : kDefaultReArmMultiplier * kReArmSecondsPerStep)
{
}

int TriggerWindow::reArmSecondsForMultiplier(int multiplier)
{
    if (multiplier <= 0)
        multiplier = kDefaultReArmMultiplier;
    return multiplier * kReArmSecondsPerStep;
}

qint64 TriggerWindow::trigger(qint64 nowMs)
{
    const qint64 candidate = nowMs + static_cast<qint64>(m_reArmSeconds) * 1000;
    m_expiresAtMs = qMax(m_expiresAtMs, candidate);
    return m_expiresAtMs;
}

} // namespace phicore::zwemo
