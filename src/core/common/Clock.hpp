#pragma once

#include <QtCore/QDateTime>

namespace Sluice {

// Wall-clock source for every time-based decision (quota intervals,
// stall and timeout thresholds, daily counters). Tests substitute a
// manually advanced clock.
class Clock {
public:
    virtual ~Clock() = default;
    virtual QDateTime now() const = 0;
};

class SystemClock : public Clock {
public:
    QDateTime now() const override { return QDateTime::currentDateTimeUtc(); }
};

} // namespace Sluice
