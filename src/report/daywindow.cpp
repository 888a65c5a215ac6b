#include "daywindow.h"
#include <QTimeZone>

DayWindow DayWindow::forDate(const QDate& date, int utcOffsetSeconds)
{
    DayWindow window;
    if (!date.isValid()) {
        return window;
    }

    QDateTime localStart(date, QTime(0, 0), QTimeZone::fromSecondsAheadOfUtc(utcOffsetSeconds));
    window.start = localStart.toUTC();
    window.end = localStart.addDays(1).toUTC();
    return window;
}

bool DayWindow::contains(const QDateTime& time) const
{
    return time.isValid() && time >= start && time < end;
}

QList<GlucoseReading> DayWindow::filter(const QList<GlucoseReading>& readings) const
{
    QList<GlucoseReading> result;
    for (const GlucoseReading& reading : readings) {
        if (!reading.timestamp.isValid() || contains(reading.timestamp))
            result.append(reading);
    }
    return result;
}

QList<TreatmentEvent> DayWindow::filter(const QList<TreatmentEvent>& treatments) const
{
    QList<TreatmentEvent> result;
    for (const TreatmentEvent& treatment : treatments) {
        if (!treatment.timestamp.isValid() || contains(treatment.timestamp))
            result.append(treatment);
    }
    return result;
}
