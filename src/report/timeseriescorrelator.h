#pragma once

#include "../nightscout/nightscoutrecords.h"
#include <QList>
#include <QString>

// Matches treatments to the nearest CGM reading and formats the glucose
// column of the report, e.g. "120 (+3) ↗ / measured:118".
class TimeSeriesCorrelator {
public:
    static constexpr int DEFAULT_TOLERANCE_SECONDS = 900;

    // readings must be sorted ascending by timestamp and have valid timestamps
    explicit TimeSeriesCorrelator(const QList<GlucoseReading>& readings,
                                  int toleranceSeconds = DEFAULT_TOLERANCE_SECONDS);

    // Closest reading strictly within the tolerance, or nullptr.
    // Equal distances resolve to the earlier reading.
    const GlucoseReading* findNearest(const QDateTime& time) const;

    // CGM part only ("120 (+3) ↗"), empty if no usable reading
    QString cgmDisplay(const QDateTime& time) const;

    // Full glucose column; empty when there's neither a CGM match nor a measured value
    QString glucoseDisplay(const TreatmentEvent& treatment) const;

    static QString formatReading(const GlucoseReading& reading);

private:
    int firstIndexAt(int index) const;

    QList<GlucoseReading> m_readings;
    qint64 m_toleranceMs;
};
