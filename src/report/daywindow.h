#pragma once

#include "../nightscout/nightscoutrecords.h"
#include <QDate>
#include <QDateTime>
#include <QList>

// One local calendar day [00:00, 24:00) at a fixed UTC offset, as UTC instants.
// This is the range the Nightscout queries ask for (find[dateString][$gte/$lt]).
struct DayWindow {
    QDateTime start;
    QDateTime end;

    static DayWindow forDate(const QDate& date, int utcOffsetSeconds);

    bool isValid() const { return start.isValid() && end.isValid(); }
    bool contains(const QDateTime& time) const;

    // Records with unparseable timestamps are kept; the assembler skips them
    QList<GlucoseReading> filter(const QList<GlucoseReading>& readings) const;
    QList<TreatmentEvent> filter(const QList<TreatmentEvent>& treatments) const;
};
