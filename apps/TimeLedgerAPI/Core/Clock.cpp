#include "Clock.h"

#include <QTime>

QDateTime SystemClock::now() const
{
    QDateTime current = QDateTime::currentDateTimeUtc();
    return current.addMSecs(-current.time().msec());
}
