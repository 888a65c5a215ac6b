#pragma once

#include "dailyreport.h"
#include "timeseriescorrelator.h"
#include "../nightscout/nightscoutrecords.h"
#include <QList>
#include <optional>

class StatsAggregator;

// Builds the daily report from one day's entries and treatments.
// Stateless between calls: the same input always yields the same report.
class ReportAssembler {
public:
    explicit ReportAssembler(int utcOffsetSeconds = 9 * 3600,
                             int toleranceSeconds = TimeSeriesCorrelator::DEFAULT_TOLERANCE_SECONDS);

    DailyReport assemble(const QList<GlucoseReading>& readings,
                         const QList<TreatmentEvent>& treatments) const;

    // HH:mm at the configured display offset
    QString displayTime(const QDateTime& utc) const;

    // Drops records with unparseable timestamps, then stable-sorts by time
    static QList<GlucoseReading> sortedReadings(const QList<GlucoseReading>& readings);
    static QList<TreatmentEvent> sortedTreatments(const QList<TreatmentEvent>& treatments);

private:
    std::optional<ReportRow> buildRow(const TreatmentEvent& treatment,
                                      const TimeSeriesCorrelator& correlator,
                                      StatsAggregator& stats) const;

    int m_utcOffsetSeconds;
    int m_toleranceSeconds;
};
