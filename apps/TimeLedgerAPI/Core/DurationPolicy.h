#ifndef DURATIONPOLICY_H
#define DURATIONPOLICY_H

#include <QDateTime>
#include <QString>

/**
 * @brief Conversion of start/end instants into billable durations
 *
 * Rounding is half-up at the 30 second boundary: 29 s adds nothing, 30 s adds
 * a minute. Negative spans (clock skew) clamp to zero and are logged. A
 * finished session always books at least one minute.
 */
class DurationPolicy
{
public:
    static constexpr int kSecondsPerMinute = 60;
    static constexpr int kRoundUpThresholdSeconds = 30;
    static constexpr int kMinimumBillableMinutes = 1;

    // max(0, floor(end - start)) in seconds; for live display only
    static qint64 elapsedSeconds(const QDateTime &start, const QDateTime &end);

    // Whole minutes for a span, rounded half-up at 30 s, floored at 0
    static int roundedMinutes(qint64 seconds);

    // roundedMinutes(elapsedSeconds(start, end)); duration(t, t) == 0
    static int durationMinutes(const QDateTime &start, const QDateTime &end);

    // Minutes recorded when a session is stopped; never below one minute
    static int billableMinutes(const QDateTime &start, const QDateTime &end);

    /**
     * @brief Convert a legacy seconds value to minutes, preserving the sign
     *
     * The magnitude is rounded like roundedMinutes(). When @p keepNonZero is
     * set, a nonzero input never becomes zero (used for adjustments, which
     * must stay nonzero).
     */
    static int minutesFromLegacySeconds(qint64 seconds, bool keepNonZero);

    // "HH:MM:SS" with at least two hour digits; negative values get a leading '-'
    static QString formatHms(qint64 seconds);
};

#endif // DURATIONPOLICY_H
