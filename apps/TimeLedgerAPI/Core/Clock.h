#ifndef CLOCK_H
#define CLOCK_H

#include <QDateTime>

/**
 * @brief Source of the current instant
 *
 * now() always returns UTC. Conversion to the display timezone happens only
 * where a month key or a human-readable timestamp is produced.
 */
class Clock
{
public:
    virtual ~Clock() = default;
    virtual QDateTime now() const = 0;
};

/**
 * @brief Wall clock truncated to whole seconds
 */
class SystemClock : public Clock
{
public:
    QDateTime now() const override;
};

#endif // CLOCK_H
