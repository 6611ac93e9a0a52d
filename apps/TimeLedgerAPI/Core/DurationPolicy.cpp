#include "DurationPolicy.h"
#include "logger/logger.h"

#include <QtGlobal>

qint64 DurationPolicy::elapsedSeconds(const QDateTime &start, const QDateTime &end)
{
    if (!start.isValid() || !end.isValid()) {
        LOG_WARNING("Elapsed time requested with an invalid instant, using 0");
        return 0;
    }

    const qint64 millis = start.msecsTo(end);
    if (millis < 0) {
        LOG_WARNING(QString("End instant %1 precedes start %2 (clock skew), clamping to 0")
                    .arg(end.toUTC().toString(Qt::ISODate), start.toUTC().toString(Qt::ISODate)));
        return 0;
    }

    return millis / 1000;
}

int DurationPolicy::roundedMinutes(qint64 seconds)
{
    if (seconds <= 0) {
        return 0;
    }

    const qint64 whole = seconds / kSecondsPerMinute;
    const qint64 leftover = seconds % kSecondsPerMinute;
    return static_cast<int>(whole + (leftover >= kRoundUpThresholdSeconds ? 1 : 0));
}

int DurationPolicy::durationMinutes(const QDateTime &start, const QDateTime &end)
{
    return roundedMinutes(elapsedSeconds(start, end));
}

int DurationPolicy::billableMinutes(const QDateTime &start, const QDateTime &end)
{
    return qMax(kMinimumBillableMinutes, durationMinutes(start, end));
}

int DurationPolicy::minutesFromLegacySeconds(qint64 seconds, bool keepNonZero)
{
    if (seconds == 0) {
        return 0;
    }

    const qint64 magnitude = seconds < 0 ? -seconds : seconds;
    int minutes = roundedMinutes(magnitude);
    if (keepNonZero && minutes == 0) {
        minutes = kMinimumBillableMinutes;
    }
    return seconds < 0 ? -minutes : minutes;
}

QString DurationPolicy::formatHms(qint64 seconds)
{
    const bool negative = seconds < 0;
    const qint64 total = negative ? -seconds : seconds;

    const qint64 hours = total / 3600;
    const qint64 minutes = (total % 3600) / 60;
    const qint64 secs = total % 60;

    return QString("%1%2:%3:%4")
        .arg(negative ? QStringLiteral("-") : QString())
        .arg(hours, 2, 10, QLatin1Char('0'))
        .arg(minutes, 2, 10, QLatin1Char('0'))
        .arg(secs, 2, 10, QLatin1Char('0'));
}
